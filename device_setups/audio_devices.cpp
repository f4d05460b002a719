#include "audio_devices.hpp"
#include "audio/audio_input.hpp"

#include <SFML/Audio/PlaybackDevice.hpp>
#include <iostream>

std::vector<std::string> getPlaybackDevices() {
    return sf::PlaybackDevice::getAvailableDevices();
}

void printAudioDevices(int selectedInput, const std::string& selectedOutput) {
    auto inputs = Audio::PortAudioInput::listInputDevices();
    std::cout << "Input devices:\n";
    if (inputs.empty()) {
        std::cout << "  (none)\n";
    }
    for (const auto& line : inputs) {
        std::cout << "  " << line << "\n";
    }
    std::cout << "  selected: "
              << (selectedInput >= 0 ? "[" + std::to_string(selectedInput) + "]" : std::string("default"))
              << "\n";

    auto outputs = getPlaybackDevices();
    auto defaultOut = sf::PlaybackDevice::getDefaultDevice();
    std::cout << "Playback devices:\n";
    if (outputs.empty()) {
        std::cout << "  (none)\n";
    }
    for (size_t i = 0; i < outputs.size(); i++) {
        std::cout << "  [" << i << "] " << outputs[i];
        if (defaultOut && *defaultOut == outputs[i]) std::cout << "  (default)";
        if (!selectedOutput.empty() && selectedOutput == outputs[i]) std::cout << "  *selected*";
        std::cout << "\n";
    }
}
