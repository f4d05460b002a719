#pragma once
#include <string>

// Returns the full path to the resources folder
// - In portable mode (COMPREHEND_PORTABLE_ONLY=1), points to ./resources next to exe
// - In install mode, points to ${CMAKE_INSTALL_DATADIR}/comprehend/resources
std::string getResourcePath();

// Resolve a whisper model file name against resources/models
std::string getModelPath(const std::string& modelName);
