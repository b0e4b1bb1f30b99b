// SPDX-License-Identifier: MIT
#include "app/RenderScheduler.h"

#include <fmt/format.h>

#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

RenderScheduler::RenderScheduler(PreviewFunction preview, ExportFunction exporter)
    : m_preview(std::move(preview))
    , m_exporter(std::move(exporter))
{
    if (!m_preview || !m_exporter)
        throw std::invalid_argument("RenderScheduler needs both a preview and an export function");
}

void RenderScheduler::requestPreview(EditState state)
{
    if (m_pendingPreview)
        ++m_previewsDropped;
    m_pendingPreview = std::move(state);
}

void RenderScheduler::submitExport(ExportJob job)
{
    m_exports.push_back(std::move(job));
}

void RenderScheduler::onFrame()
{
    // A callback that pumps the frame loop again must not nest renders.
    if (m_running)
        return;
    m_running = true;
    struct RunningReset {
        bool& flag;
        ~RunningReset() { flag = false; }
    } runningReset { m_running };

    std::optional<EditState> preview = std::move(m_pendingPreview);
    m_pendingPreview.reset();

    // Jobs submitted from a completion callback wait for the next frame.
    std::deque<ExportJob> exports;
    exports.swap(m_exports);
    for (ExportJob& job : exports)
        runExport(job);

    if (m_pendingPreview) {
        // Requested while an export ran: it supersedes the snapshot and waits for the next frame.
        if (preview)
            ++m_previewsDropped;
        preview.reset();
    }

    if (preview) {
        m_preview(*preview);
        ++m_previewsRendered;
    }
}

void RenderScheduler::runExport(ExportJob& job)
{
    ExportResult result;
    try {
        result = m_exporter(job.state, job.options);
    } catch (const ExportError& e) {
        ++m_exportsFailed;
        std::cerr << fmt::format("[RenderScheduler] export failed: {}", e.what()) << std::endl;
        if (job.onError)
            job.onError(e);
        return;
    } catch (const std::exception& e) {
        ++m_exportsFailed;
        const ExportError wrapped(e.what());
        std::cerr << fmt::format("[RenderScheduler] export failed: {}", e.what()) << std::endl;
        if (job.onError)
            job.onError(wrapped);
        return;
    }

    ++m_exportsCompleted;
    if (job.onComplete)
        job.onComplete(result);
}
