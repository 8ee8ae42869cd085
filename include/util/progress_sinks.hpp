#pragma once

#include "payload/progress.hpp"

#include <string>

namespace ue {

// Atomically replaces |path| with a small JSON status document on every event.
class FileProgressSink final : public IProgress {
public:
    explicit FileProgressSink(std::string path);

    void OnProgress(const ProgressEvent& e) override;

private:
    std::string path_;
};

class ConsoleProgressSink final : public IProgress {
public:
    ConsoleProgressSink() = default;

    void OnProgress(const ProgressEvent& e) override;

private:
    int last_pct_ = -1;
};

// Fans one event out to several sinks; null entries are skipped.
class ProgressFanout final : public IProgress {
public:
    ProgressFanout(IProgress* a, IProgress* b) : a_(a), b_(b) {}

    void OnProgress(const ProgressEvent& e) override {
        if (a_) a_->OnProgress(e);
        if (b_) b_->OnProgress(e);
    }

private:
    IProgress* a_ = nullptr;
    IProgress* b_ = nullptr;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace ue
