#pragma once

#include <string>

#include "audio_format.hpp"
#include "framer.hpp"
#include "reconnecting_reader.hpp"

struct Config {
    std::string source;                    // descriptor; empty falls back to the first capture device
    AudioFormat target = discord_voice_format();
    ReconnectPolicy reconnect;
    FramerOptions framer;
};

// Defaults overridden from LOOPCAST_* (and the legacy ICECAST_URL,
// AUDIO_SAMPLE_RATE) environment variables. Throws ConfigurationError on
// values that do not parse or describe an unusable format.
Config load_config();
