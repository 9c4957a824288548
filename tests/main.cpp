//
// Created by moinshaikh on 2/14/26.
//

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include<doctest/doctest.h>
