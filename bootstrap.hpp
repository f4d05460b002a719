#pragma once
#include "settings.hpp"

// Loads configs and checks the resources the voice pipeline needs.
// Never throws; problems are logged as failed phases.
VoiceSettings runBootstrapChecks();
