/*
 * FeedSync Server v1.0
 * Core Type Helpers
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#include "feedsync_types.h"

namespace feedsync {

bool command_type_parse(const char* s, CommandType* out) {
    if (!s || !out) return false;

    static const CommandType all[] = {
        CommandType::FEED_NOW, CommandType::SET_PROFILE, CommandType::SET_SCHEDULE,
        CommandType::SET_DEFAULT_PORTION, CommandType::REBOOT, CommandType::PING,
    };
    for (size_t i = 0; i < sizeof(all) / sizeof(all[0]); ++i) {
        if (strcmp(s, command_type_str(all[i])) == 0) {
            *out = all[i];
            return true;
        }
    }
    return false;
}

bool command_status_parse(const char* s, CommandStatus* out) {
    if (!s || !out) return false;

    static const CommandStatus all[] = {
        CommandStatus::PENDING, CommandStatus::SENT, CommandStatus::ACKED, CommandStatus::FAILED,
    };
    for (size_t i = 0; i < sizeof(all) / sizeof(all[0]); ++i) {
        if (strcmp(s, command_status_str(all[i])) == 0) {
            *out = all[i];
            return true;
        }
    }
    return false;
}

} /* namespace feedsync */
