// SPDX-License-Identifier: MIT
#include "app/RenderScheduler.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

// Records every preview and export in the order they ran.
struct Recorder {
    std::vector<std::string> events;
    std::function<void()> duringExport;
    bool failExports { false };
    bool throwGenericError { false };

    RenderScheduler makeScheduler()
    {
        return RenderScheduler(
            [this](const EditState& state) { events.push_back("preview " + std::to_string(static_cast<int>(state.exposure))); },
            [this](const EditState& state, const ExportOptions& options) {
                events.push_back("export " + std::to_string(static_cast<int>(state.exposure)));
                if (duringExport)
                    duringExport();
                if (throwGenericError)
                    throw std::runtime_error("GPU lost");
                if (failExports)
                    throw ExportError("No image to export");
                ExportResult result;
                result.mimeType = std::string(mimeType(options.format));
                return result;
            });
    }
};

EditState withExposure(float exposure)
{
    EditState state;
    state.exposure = exposure;
    return state;
}

ExportJob jobFor(float exposure, std::vector<std::string>* completions = nullptr)
{
    ExportJob job;
    job.state = withExposure(exposure);
    job.options.format = ExportFormat::Png;
    if (completions)
        job.onComplete = [completions](const ExportResult& result) { completions->push_back(result.mimeType); };
    return job;
}

}

TEST(RenderScheduler, RequiresBothCallbacks)
{
    EXPECT_THROW(RenderScheduler({}, [](const EditState&, const ExportOptions&) { return ExportResult {}; }), std::invalid_argument);
    EXPECT_THROW(RenderScheduler([](const EditState&) {}, {}), std::invalid_argument);
}

TEST(RenderScheduler, LastPreviewRequestWins)
{
    Recorder recorder;
    RenderScheduler scheduler = recorder.makeScheduler();
    scheduler.requestPreview(withExposure(1));
    scheduler.requestPreview(withExposure(2));
    scheduler.requestPreview(withExposure(3));
    EXPECT_TRUE(scheduler.hasPendingPreview());

    scheduler.onFrame();
    EXPECT_EQ(recorder.events, std::vector<std::string> { "preview 3" });
    EXPECT_EQ(scheduler.previewsRendered(), 1u);
    EXPECT_EQ(scheduler.previewsDropped(), 2u);
    EXPECT_FALSE(scheduler.hasPendingPreview());

    scheduler.onFrame();
    EXPECT_EQ(recorder.events.size(), 1u);
}

TEST(RenderScheduler, ExportsRunBeforeThePreviewAndInOrder)
{
    Recorder recorder;
    RenderScheduler scheduler = recorder.makeScheduler();
    std::vector<std::string> completions;

    scheduler.requestPreview(withExposure(9));
    scheduler.submitExport(jobFor(1, &completions));
    scheduler.submitExport(jobFor(2, &completions));
    EXPECT_EQ(scheduler.pendingExports(), 2u);

    scheduler.onFrame();
    const std::vector<std::string> expected { "export 1", "export 2", "preview 9" };
    EXPECT_EQ(recorder.events, expected);
    EXPECT_EQ(completions, (std::vector<std::string> { "image/png", "image/png" }));
    EXPECT_EQ(scheduler.exportsCompleted(), 2u);
    EXPECT_EQ(scheduler.pendingExports(), 0u);
}

TEST(RenderScheduler, PreviewRequestedDuringExportWaitsForNextFrame)
{
    Recorder recorder;
    RenderScheduler scheduler = recorder.makeScheduler();
    recorder.duringExport = [&] { scheduler.requestPreview(withExposure(5)); };

    scheduler.requestPreview(withExposure(4));
    scheduler.submitExport(jobFor(1));
    scheduler.onFrame();

    EXPECT_EQ(recorder.events, std::vector<std::string> { "export 1" });
    EXPECT_EQ(scheduler.previewsDropped(), 1u);
    EXPECT_TRUE(scheduler.hasPendingPreview());

    recorder.duringExport = nullptr;
    scheduler.onFrame();
    EXPECT_EQ(recorder.events.back(), "preview 5");
    EXPECT_EQ(scheduler.previewsRendered(), 1u);
}

TEST(RenderScheduler, ExportSubmittedFromCallbackRunsNextFrame)
{
    Recorder recorder;
    RenderScheduler scheduler = recorder.makeScheduler();
    ExportJob first = jobFor(1);
    first.onComplete = [&](const ExportResult&) { scheduler.submitExport(jobFor(2)); };
    scheduler.submitExport(std::move(first));

    scheduler.onFrame();
    EXPECT_EQ(recorder.events, std::vector<std::string> { "export 1" });
    EXPECT_EQ(scheduler.pendingExports(), 1u);
    scheduler.onFrame();
    EXPECT_EQ(recorder.events.back(), "export 2");
}

TEST(RenderScheduler, FailedExportReportsThroughOnError)
{
    Recorder recorder;
    recorder.failExports = true;
    RenderScheduler scheduler = recorder.makeScheduler();

    std::string message;
    bool completed = false;
    ExportJob job = jobFor(1);
    job.onComplete = [&](const ExportResult&) { completed = true; };
    job.onError = [&](const ExportError& error) { message = error.what(); };
    scheduler.submitExport(std::move(job));
    scheduler.requestPreview(withExposure(2));

    scheduler.onFrame();
    EXPECT_FALSE(completed);
    EXPECT_EQ(message, "No image to export");
    EXPECT_EQ(scheduler.exportsFailed(), 1u);
    // The failure does not stop the frame.
    EXPECT_EQ(recorder.events.back(), "preview 2");
}

TEST(RenderScheduler, OtherExceptionsAreWrappedAsExportErrors)
{
    Recorder recorder;
    recorder.throwGenericError = true;
    RenderScheduler scheduler = recorder.makeScheduler();

    std::string message;
    ExportJob job = jobFor(1);
    job.onError = [&](const ExportError& error) { message = error.what(); };
    scheduler.submitExport(std::move(job));
    EXPECT_NO_THROW(scheduler.onFrame());
    EXPECT_EQ(message, "GPU lost");
    EXPECT_EQ(scheduler.exportsFailed(), 1u);
}

TEST(RenderScheduler, NestedFrameCallsAreIgnored)
{
    int previews = 0;
    RenderScheduler* self = nullptr;
    RenderScheduler scheduler(
        [&](const EditState&) {
            ++previews;
            EXPECT_TRUE(self->running());
            self->requestPreview(EditState {});
            self->onFrame();
        },
        [](const EditState&, const ExportOptions&) { return ExportResult {}; });
    self = &scheduler;

    scheduler.requestPreview(EditState {});
    scheduler.onFrame();
    EXPECT_EQ(previews, 1);
    EXPECT_FALSE(scheduler.running());
    EXPECT_TRUE(scheduler.hasPendingPreview());

    scheduler.onFrame();
    EXPECT_EQ(previews, 2);
}

TEST(RenderScheduler, RunningFlagResetsAfterAThrowingPreview)
{
    RenderScheduler scheduler(
        [](const EditState&) { throw std::runtime_error("preview failed"); },
        [](const EditState&, const ExportOptions&) { return ExportResult {}; });
    scheduler.requestPreview(EditState {});
    EXPECT_THROW(scheduler.onFrame(), std::runtime_error);
    EXPECT_FALSE(scheduler.running());
}
