// SPDX-License-Identifier: MIT
#pragma once

#include "edit/EditState.h"
#include "export/ExportPipeline.h"

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>

struct ExportJob {
    EditState state;
    ExportOptions options;
    std::function<void(const ExportResult&)> onComplete;
    std::function<void(const ExportError&)> onError;
};

// Cooperative frame-loop scheduler. Previews do not queue: a new request
// replaces the pending one. Exports queue and always run to completion,
// before any preview of the same frame.
class RenderScheduler {
public:
    using PreviewFunction = std::function<void(const EditState&)>;
    using ExportFunction = std::function<ExportResult(const EditState&, const ExportOptions&)>;

    RenderScheduler(PreviewFunction preview, ExportFunction exporter);

    void requestPreview(EditState state);
    void submitExport(ExportJob job);

    // Runs the queued exports, then at most one preview.
    void onFrame();

    [[nodiscard]] bool hasPendingPreview() const { return m_pendingPreview.has_value(); }
    [[nodiscard]] std::size_t pendingExports() const { return m_exports.size(); }
    [[nodiscard]] bool running() const { return m_running; }

    [[nodiscard]] std::uint64_t previewsRendered() const { return m_previewsRendered; }
    [[nodiscard]] std::uint64_t previewsDropped() const { return m_previewsDropped; }
    [[nodiscard]] std::uint64_t exportsCompleted() const { return m_exportsCompleted; }
    [[nodiscard]] std::uint64_t exportsFailed() const { return m_exportsFailed; }

private:
    void runExport(ExportJob& job);

    PreviewFunction m_preview;
    ExportFunction m_exporter;

    std::optional<EditState> m_pendingPreview;
    std::deque<ExportJob> m_exports;
    bool m_running { false };

    std::uint64_t m_previewsRendered { 0 };
    std::uint64_t m_previewsDropped { 0 };
    std::uint64_t m_exportsCompleted { 0 };
    std::uint64_t m_exportsFailed { 0 };
};
