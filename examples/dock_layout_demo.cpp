#include <chrono>
#include <cstdio>
#include <filesystem>
#include <quay/quay.hpp>
#include <string>
#include <thread>

using namespace quay;

// Headless walk through the dock: builds a default layout, persists it to
// disk, changes it and prints the resulting geometry.

class NotePanel : public Panel
{
   public:
    static constexpr const char* PANEL_NAME = "Note";

    explicit NotePanel(std::string text) : text_(std::move(text)) {}

    std::string panel_name() const override { return PANEL_NAME; }
    std::string title() const override { return text_; }

    DockItemState dump() const override { return DockItemState::panel(PANEL_NAME, "\"" + text_ + "\""); }

    void draw(const Rect& bounds) override
    {
        std::printf("  draw %-10s %6.0f %6.0f %6.0f x %-6.0f\n",
                    text_.c_str(),
                    bounds.x,
                    bounds.y,
                    bounds.w,
                    bounds.h);
    }

   private:
    std::string text_;
};

static PanelView note(const std::string& text)
{
    return PanelView(std::make_shared<NotePanel>(text));
}

static void print_layout(const DockArea& area)
{
    std::printf("%s", serialize_json(area.dump()).c_str());
    area.draw();
}

int main(int argc, char** argv)
{
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    const std::filesystem::path dir =
        argc > 1 ? std::filesystem::path(argv[1]) : std::filesystem::temp_directory_path() / "quay_demo";

    register_panel(NotePanel::PANEL_NAME,
                   [](std::weak_ptr<DockArea>, const DockItemState&, const DockItemInfo& info)
                   {
                       std::string text = info.panel_state;
                       if (text.size() >= 2 && text.front() == '"')
                           text = text.substr(1, text.size() - 2);
                       return note(text);
                   });

    auto area = DockArea::create("demo");
    area->set_read_state_hook(LayoutPersistence::file_read_hook(dir));
    area->set_write_state_hook(LayoutPersistence::file_write_hook(dir));

    TaskScheduler              scheduler;
    LayoutPersistence::Options options;
    options.expected_version = 1;
    options.autosave_delay   = std::chrono::milliseconds(200);

    LayoutPersistence persistence(
        area,
        scheduler,
        [](DockArea& a)
        {
            a.add_panel(note("main.cpp"));
            a.add_panel(note("util.hpp"));
            a.add_panel_at(note("preview"), Placement::Right, 400.0f);
            a.add_panel(note("files"), DockPlacement::Left);
            a.add_panel(note("terminal"), DockPlacement::Bottom);
        },
        options);

    persistence.restore(
        [](LayoutPersistence::RestoreResult result)
        {
            const char* names[] = {"loaded", "default", "kept (version mismatch)", "reset (version mismatch)"};
            QUAY_LOG_INFO("demo", "layout restored: {}", names[static_cast<int>(result)]);
        });

    const Rect window{0.0f, 0.0f, 1280.0f, 720.0f};
    area->layout(window);
    std::printf("\n-- restored layout --\n");
    print_layout(*area);

    // Collapse the bottom dock and zoom the preview.
    area->toggle_dock(DockPlacement::Bottom);
    if (auto preview = area->find_panel([](const PanelView& p) { return p.title() == "preview"; }))
        area->toggle_zoom(preview);
    area->layout(window);
    std::printf("\n-- bottom dock closed, preview zoomed --\n");
    area->draw();

    area->clear_zoom();
    area->toggle_dock(DockPlacement::Bottom);
    area->resize_dock(DockPlacement::Left, 320.0f, 0.0f);
    area->layout(window);
    std::printf("\n-- left dock resized --\n");
    area->draw();

    // Let the debounced autosave fire.
    while (persistence.has_pending_save())
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        scheduler.poll();
    }

    QUAY_LOG_INFO("demo", "layout stored under {}", (dir / (options.key + ".json")).string());
    return 0;
}
