#pragma once

#include <expected>
#include <optional>
#include <string>

enum class ProviderEventType { Transcript, Error, Metadata, UtteranceEnd, SpeechStarted, Unknown };

struct ProviderEvent {
    ProviderEventType type = ProviderEventType::Unknown;
    std::string text;
    bool is_final = false;
    std::optional<int> speaker;
    std::string error;
};

// Parses one inbound text frame from a Deepgram-style live endpoint.
std::expected<ProviderEvent, std::string> parse_provider_message(const std::string& payload);
