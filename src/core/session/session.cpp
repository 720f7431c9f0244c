#include "core/session/session.hpp"

namespace endurain {
namespace core {

const char* ClientTypeToString(ClientType type) {
    switch (type) {
        case ClientType::kWeb:
            return "web";
        case ClientType::kMobile:
            return "mobile";
    }
    return "unknown";
}

std::optional<ClientType> ParseClientType(const std::string& text) {
    if (text == "web") {
        return ClientType::kWeb;
    }
    if (text == "mobile") {
        return ClientType::kMobile;
    }
    return std::nullopt;
}

void SessionUpdate::ApplyTo(Session& session) const {
    if (refresh_token_hash) {
        session.refresh_token_hash = *refresh_token_hash;
    }
    if (rotation_count) {
        session.rotation_count = *rotation_count;
    }
    if (last_rotation_at) {
        session.last_rotation_at = *last_rotation_at;
    }
    if (last_activity_at) {
        session.last_activity_at = *last_activity_at;
    }
    if (expires_at) {
        session.expires_at = *expires_at;
    }
    if (csrf_token_hash) {
        session.csrf_token_hash = *csrf_token_hash;
    }
    if (ip_address) {
        session.ip_address = *ip_address;
    }
    if (user_agent) {
        session.user_agent = *user_agent;
    }
    if (oauth_state_id) {
        session.oauth_state_id = *oauth_state_id;
    }
    if (tokens_exchanged) {
        session.tokens_exchanged = *tokens_exchanged;
    }
}

}
}
