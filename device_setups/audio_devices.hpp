#pragma once
#include <string>
#include <vector>

// Returns list of playback (output) device names known to SFML
std::vector<std::string> getPlaybackDevices();

// Prints input (PortAudio) and playback (SFML) devices to stdout,
// marking the ones selected by voice_config.json
void printAudioDevices(int selectedInput, const std::string& selectedOutput);
