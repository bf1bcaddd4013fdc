#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <quay/dock_area.hpp>
#include <quay/task_scheduler.hpp>
#include <string>

namespace quay
{

struct LayoutPersistenceOptions
{
    std::string               key = "dock_layout";
    std::optional<size_t>     expected_version;
    std::chrono::milliseconds autosave_delay{1000};
};

/**
 * LayoutPersistence: restores a DockArea from its storage hooks and keeps
 * the stored copy up to date.
 *
 * restore() loads the saved layout or falls back to the host's default
 * layout. Afterwards every layout change (re)arms a single autosave task on
 * the scheduler; the write is skipped when the dump equals what was last
 * stored. The area is held weakly, and completions arriving after this
 * object is destroyed are ignored.
 */
class LayoutPersistence
{
   public:
    using Options = LayoutPersistenceOptions;

    enum class RestoreResult
    {
        Loaded,                 // saved layout matched the expected version
        Default,                // nothing usable was stored
        VersionMismatchKept,    // prompt declined, saved layout kept
        VersionMismatchReset,   // prompt accepted, default layout stored
    };

    // Populates an area that has just been cleared.
    using DefaultLayoutBuilder = std::function<void(DockArea& area)>;
    using PromptAnswer         = std::function<void(bool reset_to_default)>;
    using PromptHook =
        std::function<void(std::optional<size_t> saved_version, std::optional<size_t> expected_version, PromptAnswer answer)>;
    using RestoreCallback = std::function<void(RestoreResult result)>;

    LayoutPersistence(std::shared_ptr<DockArea> area,
                      TaskScheduler&            scheduler,
                      DefaultLayoutBuilder      build_default,
                      Options                   options = {});
    ~LayoutPersistence();

    LayoutPersistence(const LayoutPersistence&)            = delete;
    LayoutPersistence& operator=(const LayoutPersistence&) = delete;

    const Options& options() const { return options_; }

    // Without a prompt hook a version mismatch keeps the saved layout.
    void set_prompt_hook(PromptHook hook) { prompt_hook_ = std::move(hook); }

    void restore(RestoreCallback done = {});

    // Debounced: re-arms the autosave task.
    void on_layout_changed();
    // Saves now and drops any pending autosave. Returns false when nothing
    // was written (unchanged layout or no area).
    bool flush();
    // Replaces the layout with the default one and stores it immediately.
    void reset_to_default();

    bool                              has_pending_save() const { return pending_save_.has_value(); }
    const std::optional<std::string>& last_persisted() const { return last_persisted_; }

    // Storage hooks keeping each key in `<dir>/<key>.json`.
    static DockArea::ReadHook  file_read_hook(std::filesystem::path dir);
    static DockArea::WriteHook file_write_hook(std::filesystem::path dir);

   private:
    void apply_default(DockArea& area);
    void cancel_pending_save();
    bool save_now();

    std::weak_ptr<DockArea>              area_;
    TaskScheduler&                       scheduler_;
    DefaultLayoutBuilder                 build_default_;
    Options                              options_;
    PromptHook                           prompt_hook_;
    std::optional<TaskScheduler::TaskId> pending_save_;
    std::optional<std::string>           last_persisted_;
    std::shared_ptr<int>                 alive_ = std::make_shared<int>(0);
};

}   // namespace quay
