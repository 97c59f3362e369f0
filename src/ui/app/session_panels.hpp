#pragma once

#ifdef TRACEMARK_USE_IMGUI

    #include <optional>
    #include <set>
    #include <string>
    #include <tracemark/config.hpp>
    #include <tracemark/session_events.hpp>
    #include <vector>

namespace tracemark
{

class CommandRegistry;
class DataItem;
class SessionModel;
class ShortcutManager;

namespace sync
{
class IntervalSync;
class SpanView;
}   // namespace sync

// The main window: command menus, the item list, the outline plot on top and the
// detail plot below it. Mouse gestures on the plots go to IntervalSync; everything
// drawn comes from the views' derived state.
class SessionPanels
{
   public:
    SessionPanels(SessionModel&      model,
                  sync::IntervalSync& sync,
                  CommandRegistry&   commands,
                  ShortcutManager&   shortcuts,
                  const AppConfig&   config);

    SessionPanels(const SessionPanels&)            = delete;
    SessionPanels& operator=(const SessionPanels&) = delete;

    void draw();

    // Rows selected in the item list, in model order.
    std::vector<DataItem*> selected_items() const;

    // One-line message shown in the status bar until the next one.
    void set_status(std::string message) { status_ = std::move(message); }

   private:
    enum class PlotRole
    {
        Outline,
        Detail,
    };

    struct Drag
    {
        PlotRole role;
        double   start;   // Axis space
        double   current;
    };

    void draw_menu_bar();
    void draw_item_list();
    void draw_plot(sync::SpanView& view, PlotRole role, float height);
    void draw_status_bar();

    SessionModel&       model_;
    sync::IntervalSync& sync_;
    CommandRegistry&    commands_;
    ShortcutManager&    shortcuts_;
    AppConfig           config_;

    std::set<const DataItem*> selected_;
    std::optional<Drag>       drag_;
    std::string               status_;
    ConnectionSet             connections_;
};

}   // namespace tracemark

#endif   // TRACEMARK_USE_IMGUI
