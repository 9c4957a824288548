//
// Created by moinshaikh on 1/28/26.
//

#pragma once
#include"Algorithms/Algorithm.hpp"
#include"Algorithms/EntropyTemperature.hpp"
#include"Algorithms/ParameterPhase.hpp"
#include"Algorithms/Sac.hpp"
#include"Algorithms/SacLoss.hpp"


#include"Distribution/Categorical.hpp"
#include"Distribution/Distribution.hpp"


#include"Environment/BanditEnvironment.hpp"
#include"Environment/Environment.hpp"
#include"Environment/FixedHorizonEnvironment.hpp"


#include"Generator/EpisodeGenerator.hpp"
#include"Generator/Generator.hpp"


#include"Model/ActorCritic.hpp"
#include"Model/MemoryEncoder.hpp"
#include"Model/modelUtils.hpp"
#include"Model/PolicyHead.hpp"
#include"Model/QNetwork.hpp"

#include"Checkpoint.hpp"
#include"Config.hpp"
#include"EpisodicBuffer.hpp"
#include"EpochLogger.hpp"
#include"EvaluationLoop.hpp"
#include"Space.hpp"
#include"TrainingLoop.hpp"
