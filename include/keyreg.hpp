#pragma once

// High-level keyreg facade

#include "keyreg/keyreg.hpp"
