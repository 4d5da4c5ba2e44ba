/*
 * FeedSync Server v1.0
 * Command Dispatch Queue — Implementation
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#include "feedsync_commands.h"
#include "feedsync_crypto.h"
#include "feedsync_json.h"
#include "feedsync_log.h"

namespace feedsync {

CommandQueue::CommandQueue(Store* store, const FeedPlatform* platform)
    : store_(store)
    , platform_(platform)
{}

int64_t CommandQueue::now_ms() const {
    return (platform_ && platform_->get_epoch_ms) ? platform_->get_epoch_ms() : 0;
}

FeedError CommandQueue::enqueue(const std::string& device_id, CommandType type,
                                const std::string& payload_json, CommandRecord* out) {
    if (!store_ || !platform_) return FeedError::NOT_INITIALIZED;
    if (device_id.empty()) return FeedError::DEVICE_ID_REQUIRED;
    if (!json::is_object(payload_json.data(), payload_json.size())) return FeedError::INVALID_PARAMS;

    char id[FEEDSYNC_UUID_LEN + 1];
    FeedError err = crypto::generate_uuid_v4(id, platform_->random_bytes);
    if (err != FeedError::OK) return err;

    CommandRecord cmd;
    cmd.id            = id;
    cmd.device_id     = device_id;
    cmd.type          = type;
    cmd.payload_json  = payload_json;
    cmd.status        = CommandStatus::PENDING;
    cmd.created_at_ms = now_ms();

    err = store_->insert_command(cmd);
    if (err != FeedError::OK) {
        FEEDSYNC_LOG_ERROR("enqueue %s for %s failed: %s",
                           command_type_str(type), device_id.c_str(), feed_error_str(err));
        return err;
    }

    FEEDSYNC_LOG_INFO("queued %s %s for %s", command_type_str(type), cmd.id.c_str(), device_id.c_str());
    if (out) *out = cmd;
    return FeedError::OK;
}

FeedError CommandQueue::claim_pending(const std::string& device_id, size_t limit,
                                      std::vector<CommandRecord>* out) {
    if (!store_) return FeedError::NOT_INITIALIZED;
    if (!out) return FeedError::INTERNAL_ERROR;
    if (limit > FEEDSYNC_CLAIM_BATCH) limit = FEEDSYNC_CLAIM_BATCH;

    return store_->claim_commands(device_id, limit, false, now_ms(), out);
}

FeedError CommandQueue::claim_for_delivery(const std::string& device_id, size_t limit,
                                           std::vector<CommandRecord>* out) {
    if (!store_) return FeedError::NOT_INITIALIZED;
    if (!out) return FeedError::INTERNAL_ERROR;
    if (limit > FEEDSYNC_CLAIM_BATCH) limit = FEEDSYNC_CLAIM_BATCH;

    FeedError err = store_->claim_commands(device_id, limit, true, now_ms(), out);
    if (err != FeedError::OK) {
        FEEDSYNC_LOG_ERROR("claim for %s failed: %s", device_id.c_str(), feed_error_str(err));
        return err;
    }

    for (size_t i = 0; i < out->size(); ++i) {
        const CommandRecord& c = (*out)[i];
        FEEDSYNC_LOG_DEBUG("deliver %s %s to %s", command_type_str(c.type), c.id.c_str(), device_id.c_str());
    }
    return FeedError::OK;
}

FeedError CommandQueue::ack(const std::string& device_id, const std::vector<std::string>& command_ids) {
    if (!store_) return FeedError::NOT_INITIALIZED;
    if (command_ids.empty()) return FeedError::OK;

    FeedError err = store_->ack_commands(device_id, command_ids, now_ms());
    if (err != FeedError::OK) {
        FEEDSYNC_LOG_ERROR("ack for %s failed: %s", device_id.c_str(), feed_error_str(err));
    }
    return err;
}

FeedError CommandQueue::cancel(const std::string& device_id, const std::string& command_id) {
    if (!store_) return FeedError::NOT_INITIALIZED;

    FeedError err = store_->fail_command(device_id, command_id);
    if (err == FeedError::OK) {
        FEEDSYNC_LOG_INFO("cancelled command %s for %s", command_id.c_str(), device_id.c_str());
    }
    return err;
}

FeedError CommandQueue::find(const std::string& command_id, CommandRecord* out, bool* found) {
    if (!store_) return FeedError::NOT_INITIALIZED;
    return store_->find_command(command_id, out, found);
}

} /* namespace feedsync */
