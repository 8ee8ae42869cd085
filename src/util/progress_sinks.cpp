#include "util/progress_sinks.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <string>

namespace ue {

namespace {
bool g_progress_line_active = false;

int Percent(std::uint64_t done, std::uint64_t total) {
    if (total == 0) return 0;
    const int pct = static_cast<int>((done * 100ULL) / total);
    return pct > 100 ? 100 : pct;
}
} // namespace

FileProgressSink::FileProgressSink(std::string path) : path_(std::move(path)) {}

void FileProgressSink::OnProgress(const ProgressEvent& e) {
    nlohmann::json j;
    j["operation"] = std::string(e.operation);
    j["operations_done"] = e.ops_done;
    j["operations_total"] = e.ops_total;
    j["bytes_written"] = e.bytes_written;
    j["percent"] = Percent(e.ops_done, e.ops_total);

    const std::string tmp_path = path_ + ".tmp";
    std::ofstream os(tmp_path, std::ios::trunc);
    if (!os.good())
        return;
    os << j.dump();
    os.close();
    if (!os.good())
        return;

    std::rename(tmp_path.c_str(), path_.c_str());
}

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    const int pct = Percent(e.ops_done, e.ops_total);
    if (pct == last_pct_ && e.ops_done < e.ops_total)
        return;
    last_pct_ = pct;

    std::fprintf(stderr,
                 "\r[%-13.*s] %3d%% | op %llu/%llu | %llu bytes",
                 (int)e.operation.size(),
                 e.operation.data(),
                 pct,
                 (unsigned long long)e.ops_done,
                 (unsigned long long)e.ops_total,
                 (unsigned long long)e.bytes_written);
    std::fflush(stderr);
    g_progress_line_active = true;

    if (e.ops_total > 0 && e.ops_done >= e.ops_total) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

} // namespace ue
