#include "tus/store/session_store.hpp"
#include "tus/upload/metadata.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <charconv>

namespace tus {
namespace store {

using json = nlohmann::json;

namespace {

constexpr const char* kFilename = "filename";
constexpr const char* kFileSize = "file_size";
constexpr const char* kOffset = "offset";
constexpr const char* kMetadata = "metadata";

std::string metadata_to_json(const upload::Metadata& metadata) {
    json j = json::object();
    for (const auto& [key, value] : metadata) {
        j[key] = upload::encode_base64(value);
    }
    return j.dump();
}

std::optional<upload::Metadata> metadata_from_json(const std::string& text) {
    auto j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    upload::Metadata metadata;
    for (const auto& [key, value] : j.items()) {
        if (!value.is_string()) {
            return std::nullopt;
        }
        auto decoded = upload::decode_base64(value.get<std::string>());
        if (decoded.is_error()) {
            return std::nullopt;
        }
        metadata.emplace(key, std::move(decoded.value()));
    }
    return metadata;
}

bool parse_u64(const std::string& text, std::uint64_t& out) {
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, out);
    return ec == std::errc() && ptr == last && !text.empty();
}

} // namespace

SessionStore::SessionStore(Cache& cache, std::chrono::seconds ttl)
    : cache_(cache), ttl_(ttl) {
}

std::string SessionStore::key(const std::string& resource_id, const char* field) {
    return std::string(kKeyPrefix) + resource_id + "/" + field;
}

std::vector<std::string> SessionStore::all_keys(const std::string& resource_id) const {
    return {
        key(resource_id, kFilename),
        key(resource_id, kFileSize),
        key(resource_id, kOffset),
        key(resource_id, kMetadata),
    };
}

UploadResult<bool> SessionStore::create(const std::string& resource_id,
                                        const std::string& filename,
                                        std::uint64_t total_size,
                                        const upload::Metadata& metadata) {
    const std::pair<const char*, std::string> fields[] = {
        {kFilename, filename},
        {kFileSize, std::to_string(total_size)},
        {kOffset, "0"},
        {kMetadata, metadata_to_json(metadata)},
    };

    bool all_added = true;
    for (const auto& [field, value] : fields) {
        auto added = cache_.add(key(resource_id, field), value, ttl_);
        if (added.is_error()) {
            return Err<bool, Error>(added.error());
        }
        if (!added.value()) {
            spdlog::warn("Session field {} already present for {}", field, resource_id);
            all_added = false;
        }
    }

    if (all_added) {
        spdlog::debug("Session {} stored (size={}, ttl={}s)", resource_id, total_size, ttl_.count());
    }
    return Ok<bool, Error>(all_added);
}

UploadResult<std::optional<upload::UploadSession>> SessionStore::get(const std::string& resource_id) const {
    using Snapshot = std::optional<upload::UploadSession>;

    std::optional<std::string> raw[4];
    const char* fields[] = {kFilename, kFileSize, kOffset, kMetadata};
    for (std::size_t i = 0; i < 4; ++i) {
        auto value = cache_.get(key(resource_id, fields[i]));
        if (value.is_error()) {
            return Err<Snapshot, Error>(value.error());
        }
        if (!value.value().has_value()) {
            return Ok<Snapshot, Error>(std::nullopt);
        }
        raw[i] = std::move(value.value());
    }

    upload::UploadSession session;
    session.resource_id = resource_id;
    session.filename = *raw[0];

    auto metadata = metadata_from_json(*raw[3]);
    if (!parse_u64(*raw[1], session.total_size) || !parse_u64(*raw[2], session.offset) || !metadata) {
        return fail<Snapshot>(ErrorCode::InternalError, "Corrupted session record: " + resource_id);
    }
    session.metadata = std::move(*metadata);

    return Ok<Snapshot, Error>(std::move(session));
}

UploadResult<std::uint64_t> SessionStore::increment_offset(const std::string& resource_id, std::uint64_t delta) {
    auto next = cache_.incr(key(resource_id, kOffset), static_cast<std::int64_t>(delta));
    if (next.is_error()) {
        return Err<std::uint64_t, Error>(next.error());
    }

    for (const auto& entry : all_keys(resource_id)) {
        auto touched = cache_.touch(entry, ttl_);
        if (touched.is_error()) {
            return Err<std::uint64_t, Error>(touched.error());
        }
        if (!touched.value()) {
            spdlog::debug("Session key {} expired before its TTL could be renewed", entry);
        }
    }

    return Ok<std::uint64_t, Error>(static_cast<std::uint64_t>(next.value()));
}

UploadResult<void> SessionStore::delete_session(const std::string& resource_id) {
    return cache_.remove_many(all_keys(resource_id));
}

} // namespace store
} // namespace tus
