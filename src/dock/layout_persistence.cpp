#include <fstream>
#include <quay/layout_persistence.hpp>
#include <quay/logger.hpp>
#include <sstream>
#include <system_error>

namespace quay
{

namespace
{

std::string version_string(std::optional<size_t> v)
{
    return v ? std::to_string(*v) : std::string("none");
}

}   // namespace

LayoutPersistence::LayoutPersistence(std::shared_ptr<DockArea> area,
                                     TaskScheduler&            scheduler,
                                     DefaultLayoutBuilder      build_default,
                                     Options                   options)
    : area_(area),
      scheduler_(scheduler),
      build_default_(std::move(build_default)),
      options_(std::move(options))
{
    if (area)
    {
        std::weak_ptr<int> alive = alive_;
        area->set_on_layout_changed(
            [this, alive]
            {
                if (alive.lock())
                    on_layout_changed();
            });
    }
}

LayoutPersistence::~LayoutPersistence()
{
    cancel_pending_save();
    if (auto area = area_.lock())
        area->set_on_layout_changed({});
}

// ─── Restore ────────────────────────────────────────────────────────────────

void LayoutPersistence::restore(RestoreCallback done)
{
    auto area = area_.lock();
    if (!area)
        return;

    std::weak_ptr<int> alive = alive_;
    area->read_state(
        options_.key,
        [this, alive, done = std::move(done)](std::optional<std::string> value)
        {
            if (!alive.lock())
                return;
            auto area = area_.lock();
            if (!area)
                return;

            auto finish = [&done](RestoreResult result)
            {
                if (done)
                    done(result);
            };

            if (!value)
            {
                QUAY_LOG_INFO("dock.persist", "no saved layout under '{}', using the default", options_.key);
                reset_to_default();
                finish(RestoreResult::Default);
                return;
            }

            DockAreaState state;
            std::string   error;
            if (!deserialize_json(*value, state, &error))
            {
                QUAY_LOG_WARN("dock.persist", "saved layout '{}' is unreadable ({}), using the default", options_.key,
                              error);
                reset_to_default();
                finish(RestoreResult::Default);
                return;
            }

            area->load(state);
            last_persisted_ = serialize_json(area->dump());

            if (state.version == options_.expected_version)
            {
                QUAY_LOG_DEBUG("dock.persist", "restored layout '{}'", options_.key);
                finish(RestoreResult::Loaded);
                return;
            }

            QUAY_LOG_WARN("dock.persist",
                          "saved layout version {} does not match expected version {}",
                          version_string(state.version),
                          version_string(options_.expected_version));
            if (!prompt_hook_)
            {
                finish(RestoreResult::VersionMismatchKept);
                return;
            }

            prompt_hook_(state.version,
                         options_.expected_version,
                         [this, alive, done](bool reset)
                         {
                             if (!alive.lock())
                                 return;
                             if (reset)
                                 reset_to_default();
                             if (done)
                                 done(reset ? RestoreResult::VersionMismatchReset : RestoreResult::VersionMismatchKept);
                         });
        });
}

void LayoutPersistence::apply_default(DockArea& area)
{
    area.load(DockAreaState{});
    if (build_default_)
        build_default_(area);
    area.set_version(options_.expected_version);
}

void LayoutPersistence::reset_to_default()
{
    auto area = area_.lock();
    if (!area)
        return;
    apply_default(*area);
    // The builder's own change notifications armed an autosave; save_now()
    // replaces it with an immediate write.
    save_now();
}

// ─── Autosave ───────────────────────────────────────────────────────────────

void LayoutPersistence::on_layout_changed()
{
    cancel_pending_save();

    std::weak_ptr<int> alive = alive_;
    pending_save_            = scheduler_.schedule_after(options_.autosave_delay,
                                              [this, alive]
                                              {
                                                  if (!alive.lock())
                                                      return;
                                                  pending_save_.reset();
                                                  save_now();
                                              });
}

bool LayoutPersistence::flush()
{
    return save_now();
}

void LayoutPersistence::cancel_pending_save()
{
    if (pending_save_)
    {
        scheduler_.cancel(*pending_save_);
        pending_save_.reset();
    }
}

bool LayoutPersistence::save_now()
{
    cancel_pending_save();

    auto area = area_.lock();
    if (!area)
        return false;

    std::string json = serialize_json(area->dump());
    if (last_persisted_ && *last_persisted_ == json)
    {
        QUAY_LOG_TRACE("dock.persist", "layout '{}' unchanged, skipping write", options_.key);
        return false;
    }

    std::weak_ptr<int> alive = alive_;
    area->write_state(options_.key,
                      json,
                      [this, alive, json](bool ok)
                      {
                          if (!alive.lock())
                              return;
                          if (!ok)
                          {
                              QUAY_LOG_ERROR("dock.persist", "failed to save layout '{}'", options_.key);
                              return;
                          }
                          last_persisted_ = json;
                          QUAY_LOG_DEBUG("dock.persist", "saved layout '{}' ({} bytes)", options_.key, json.size());
                      });
    return true;
}

// ─── File hooks ─────────────────────────────────────────────────────────────

DockArea::ReadHook LayoutPersistence::file_read_hook(std::filesystem::path dir)
{
    return [dir = std::move(dir)](const std::string& key, DockArea::ReadCallback done)
    {
        const auto    path = dir / (key + ".json");
        std::ifstream file(path);
        if (!file.is_open())
        {
            done(std::nullopt);
            return;
        }

        std::ostringstream ss;
        ss << file.rdbuf();
        if (file.bad())
        {
            QUAY_LOG_ERROR("dock.persist", "failed to read '{}'", path.string());
            done(std::nullopt);
            return;
        }
        done(ss.str());
    };
}

DockArea::WriteHook LayoutPersistence::file_write_hook(std::filesystem::path dir)
{
    return [dir = std::move(dir)](const std::string& key, const std::string& value, DockArea::WriteCallback done)
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            QUAY_LOG_ERROR("dock.persist", "cannot create '{}': {}", dir.string(), ec.message());
            done(false);
            return;
        }

        const auto    path = dir / (key + ".json");
        std::ofstream file(path, std::ios::trunc);
        if (!file.is_open())
        {
            QUAY_LOG_ERROR("dock.persist", "cannot open '{}' for writing", path.string());
            done(false);
            return;
        }
        file << value;
        file.flush();
        done(file.good());
    };
}

}   // namespace quay
