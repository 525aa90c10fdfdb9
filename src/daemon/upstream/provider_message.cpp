#include "upstream/provider_message.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::optional<int> speaker_of(const json& alt) {
    if (alt.contains("speaker") && alt["speaker"].is_number_integer()) {
        return alt["speaker"].get<int>();
    }
    if (alt.contains("words") && alt["words"].is_array() && !alt["words"].empty()) {
        const auto& first = alt["words"].front();
        if (first.contains("speaker") && first["speaker"].is_number_integer()) {
            return first["speaker"].get<int>();
        }
    }
    return std::nullopt;
}

} // namespace

std::expected<ProviderEvent, std::string> parse_provider_message(const std::string& payload) {
    try {
        auto j = json::parse(payload);
        if (!j.is_object()) {
            return std::unexpected("provider message is not an object");
        }

        ProviderEvent ev;
        std::string type = j.value("type", "");

        if (type == "Error" || j.contains("err_code") || j.contains("error")) {
            ev.type = ProviderEventType::Error;
            if (j.contains("description") && j["description"].is_string()) {
                ev.error = j["description"].get<std::string>();
            } else if (j.contains("err_msg") && j["err_msg"].is_string()) {
                ev.error = j["err_msg"].get<std::string>();
            } else if (j.contains("error") && j["error"].is_string()) {
                ev.error = j["error"].get<std::string>();
            } else {
                ev.error = j.dump();
            }
            return ev;
        }

        if (type == "Metadata") { ev.type = ProviderEventType::Metadata; return ev; }
        if (type == "UtteranceEnd") { ev.type = ProviderEventType::UtteranceEnd; return ev; }
        if (type == "SpeechStarted") { ev.type = ProviderEventType::SpeechStarted; return ev; }

        if (j.contains("channel") && j["channel"].is_object()) {
            const auto& alts = j["channel"].value("alternatives", json::array());
            if (!alts.is_array() || alts.empty()) {
                return std::unexpected("result without alternatives");
            }
            const auto& alt = alts.front();
            ev.type = ProviderEventType::Transcript;
            ev.text = alt.value("transcript", "");
            ev.is_final = j.value("is_final", false);
            ev.speaker = speaker_of(alt);
            return ev;
        }

        return ev;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}
