#include "telemetry.hpp"
#include <openssl/rand.h>
#include <openssl/err.h>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

using json = nlohmann::json;

void to_json(json& j, const RunTelemetryRecord& r) {
    const std::string start = iso8601_utc(r.start);
    j = json{
        {"timestamp", start},
        {"model", r.model},
        {"start", start},
        {"end", iso8601_utc(r.end)},
        {"duration_ms", r.duration_ms},
        {"exit_code", r.exit_code},
        {"output_chars", r.output_chars},
        {"timed_out", r.timed_out}
    };
    if (r.batch_id) j["batch_id"] = *r.batch_id;
    if (r.concurrency) j["concurrency"] = *r.concurrency;
}

std::string iso8601_utc(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    auto ms = duration_cast<milliseconds>(tp.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) { millis += 1000; --secs; }
    std::tm tm{};
    gmtime_r(&secs, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

std::string make_batch_id() {
    using namespace std::chrono;
    unsigned char rnd[4];
    if (RAND_bytes(rnd, sizeof(rnd)) != 1) {
        std::cerr << "[telemetry] RAND_bytes failed (" << ERR_get_error() << "), using std::random_device" << std::endl;
        std::random_device rd;
        for (auto& b : rnd) b = static_cast<unsigned char>(rd() & 0xFF);
    }
    std::ostringstream ss;
    ss << "batch_" << duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count() << '_';
    for (unsigned char c : rnd) ss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return ss.str();
}

JsonlTelemetrySink::JsonlTelemetrySink(std::filesystem::path path)
    : path_(std::move(path)) {}

JsonlTelemetrySink::~JsonlTelemetrySink() {
    flush();
}

std::filesystem::path JsonlTelemetrySink::default_path() {
    const char* home = getenv("HOME");
    std::filesystem::path base = (home && *home) ? std::filesystem::path(home) / ".cache" / "ollama-batch"
                                                 : std::filesystem::path("/tmp/ollama-batch");
    return base / "runs.jsonl";
}

void JsonlTelemetrySink::record(const RunTelemetryRecord& rec) {
    std::string line;
    try {
        line = json(rec).dump(-1, ' ', false, json::error_handler_t::replace);
    } catch (const std::exception& e) {
        std::cerr << "[telemetry] failed to serialize record for " << rec.model << ": " << e.what() << std::endl;
        return;
    }
    if (!writer_.post([this, line = std::move(line)]{ append_line(line); })) {
        std::cerr << "[telemetry] sink is shutting down, record dropped" << std::endl;
    }
}

void JsonlTelemetrySink::flush() {
    try {
        writer_.drain();
    } catch (const std::exception& e) {
        std::cerr << "[telemetry] flush failed: " << e.what() << std::endl;
    }
}

void JsonlTelemetrySink::append_line(const std::string& line) {
    if (!out_.is_open()) {
        if (open_failed_) return;
        std::error_code ec;
        if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            std::cerr << "[telemetry] cannot create " << path_.parent_path() << ": " << ec.message() << std::endl;
        }
        out_.open(path_, std::ios::out | std::ios::app);
        if (!out_) {
            std::cerr << "[telemetry] cannot open " << path_ << ", telemetry disabled" << std::endl;
            open_failed_ = true;
            return;
        }
    }
    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        std::cerr << "[telemetry] write to " << path_ << " failed" << std::endl;
        out_.clear();
    }
}
