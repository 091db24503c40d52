#pragma once

#include "tierchain/tierchain.hpp"
