#include "JsonModel.h"
#include <iomanip>
#include <sstream>

using nlohmann::json;

static constexpr double BYTES_PER_GB = 1024.0 * 1024.0 * 1024.0;

std::string format_gb(uint64_t bytes) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << static_cast<double>(bytes) / BYTES_PER_GB;
    return ss.str();
}

std::string format_percent(double percent) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << percent;
    return ss.str();
}

// Необязательные поля пишутся только если заданы
template <typename T>
static void put_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

void to_json(json& j, const Volume& v) {
    j = json{
        {"identifier", v.identifier},
        {"mountPath", v.mount_path},
        {"kind", to_string(v.kind)},
        {"totalBytes", v.total_bytes},
        {"freeBytes", v.free_bytes},
        {"usedBytes", v.used_bytes},
        {"totalGB", format_gb(v.total_bytes)},
        {"freeGB", format_gb(v.free_bytes)},
        {"usedGB", format_gb(v.used_bytes)},
        {"usagePercent", format_percent(v.usage_percent())},
        {"encrypted", v.encrypted},
    };
    put_optional(j, "deviceNode", v.device_node);
    put_optional(j, "encryptionMechanism", v.encryption_mechanism);
}

void to_json(json& j, const HiddenArtifact& a) {
    j = json{
        {"path", a.path},
        {"sizeBytes", a.size_bytes},
        {"lastModifiedTimestamp", a.last_modified_ms},
        {"attributeTag", a.attribute_tag},
        {"category", a.category},
        {"originPlatform", a.origin_platform},
        {"isDirectory", a.is_directory},
    };
    put_optional(j, "displayName", a.display_name);
}

void to_json(json& j, const HiddenScanResult& r) {
    j = json{
        {"artifacts", r.artifacts},
        {"totalDiscovered", r.total_discovered},
        {"scanRoot", r.scan_root},
        {"timestamp", r.timestamp},
    };
    put_optional(j, "error", r.error);
}

void to_json(json& j, const BrowserArtifact& a) {
    j = json{
        {"name", a.name},
        {"path", a.path},
        {"sizeBytes", a.size_bytes},
        {"lastModifiedTimestamp", a.last_modified_ms},
        {"semanticType", a.semantic_type},
    };
}

void to_json(json& j, const BrowserProfile& p) {
    j = json{
        {"browserFamily", p.browser_family},
        {"profileName", p.profile_name},
        {"profilePath", p.profile_path},
        {"artifacts", p.artifacts},
    };
}

void to_json(json& j, const BrowserProfilesResult& r) {
    j = json{
        {"profiles", r.profiles},
        {"totalFound", r.total_found},
    };
    put_optional(j, "error", r.error);
}

void to_json(json& j, const EventLogEntry& e) {
    j = json{
        {"eventId", e.event_id},
        {"timeCreated", e.time_created},
        {"severity", to_string(e.severity)},
        {"source", e.source},
        {"description", e.description},
        {"channel", e.channel},
        {"privacyRisk", to_string(e.privacy_risk())},
    };
}

void to_json(json& j, const EventScanSummary& s) {
    j = json{
        {"platform", s.platform},
        {"channelsAvailable", s.channels_available},
        {"channelsQueried", s.channels_queried},
        {"channelsFailed", s.channels_failed},
        {"highRisk", s.high_risk},
        {"mediumRisk", s.medium_risk},
        {"lowRisk", s.low_risk},
    };
}

void to_json(json& j, const EventLogsResult& r) {
    j = json{
        {"supported", r.supported},
        {"logs", r.logs},
        {"totalEntries", r.total_entries},
        {"logSources", r.log_sources},
        {"scanSummary", r.summary},
    };
    put_optional(j, "error", r.error);
}

void to_json(json& j, const RiskFactors& f) {
    j = json::object();
    if (f.swap_file) {
        j["swapFile"] = {{"present", f.swap_file->present}, {"location", f.swap_file->location}};
    }
    if (f.snapshots) {
        j["snapshots"] = {{"present", f.snapshots->present},
                          {"count", f.snapshots->count},
                          {"source", f.snapshots->source}};
    }
    if (f.encryption) {
        j["encryption"] = {{"enabled", f.encryption->enabled},
                           {"coverage", f.encryption->coverage},
                           {"encryptedVolumes", f.encryption->encrypted_volumes},
                           {"totalVolumes", f.encryption->total_volumes}};
    }
    if (f.free_space) {
        j["freeSpace"] = {{"percent", f.free_space->percent},
                          {"freeBytes", f.free_space->free_bytes},
                          {"totalBytes", f.free_space->total_bytes}};
    }
}

void to_json(json& j, const RiskAssessment& r) {
    j = json{
        {"score", r.score},
        {"risk", to_string(r.risk)},
        {"factors", r.factors},
    };
    put_optional(j, "error", r.error);
}

void to_json(json& j, const PreviewResult& r) {
    j = json{
        {"content", r.content},
        {"bytesRead", r.bytes_read},
        {"isBinary", r.is_binary},
    };
    put_optional(j, "error", r.error);
}

void to_json(json& j, const ReportResult& r) {
    j = json{{"success", r.success}};
    put_optional(j, "reportId", r.report_id);
    put_optional(j, "documentPath", r.document_path);
    put_optional(j, "dataPath", r.data_path);
    put_optional(j, "signature", r.signature);
    put_optional(j, "error", r.error);
}

void to_json(json& j, const VerifyResult& r) {
    j = json{{"valid", r.valid}};
    put_optional(j, "reportId", r.report_id);
    put_optional(j, "timestamp", r.timestamp);
    put_optional(j, "publicKeyMatch", r.public_key_match);
    put_optional(j, "error", r.error);
}

void to_json(json& j, const ProgressEvent& e) {
    j = json{
        {"step", e.step},
        {"totalSteps", e.total_steps},
        {"progressPercent", e.progress_percent},
        {"message", e.message},
        {"completed", e.completed},
    };
}
