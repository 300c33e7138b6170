#pragma once

// Umbrella header for the guided diarization training core

#include "guidiar/annotation.hpp"
#include "guidiar/config.hpp"
#include "guidiar/discretize.hpp"
#include "guidiar/guidance.hpp"
#include "guidiar/interfaces.hpp"
#include "guidiar/loss.hpp"
#include "guidiar/random.hpp"
#include "guidiar/speaker_budget.hpp"
#include "guidiar/task.hpp"
#include "guidiar/tensor_utils.hpp"
