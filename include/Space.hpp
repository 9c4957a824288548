#pragma once
//
// Created by moinshaikh on 1/27/26.
//

#ifndef METASAC_SPACE_HPP
#define METASAC_SPACE_HPP

#include<string>
#include<vector>
#include<cstdint>

namespace MetaSac
{
    /**
     * @brief Description of an environment action space
     *
     * Only "Discrete" spaces are accepted by the trainer; `shape[0]` holds the
     * number of actions.
     */
    struct ActionSpace
    {
        std::string type;
        std::vector<int64_t> shape;
    };

    /** @return Number of discrete actions in `space` */
    inline int64_t numActions(const ActionSpace &space)
    {
        return space.shape.empty() ? 0 : space.shape[0];
    }
}

#endif //METASAC_SPACE_HPP
