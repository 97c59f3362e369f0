#ifdef TRACEMARK_USE_IMGUI

    #include "ui/app/session_panels.hpp"

    #include <algorithm>
    #include <cmath>
    #include <cstdio>
    #include <ctime>
    #include <imgui.h>
    #include <tracemark/label.hpp>
    #include <tracemark/logger.hpp>
    #include <tracemark/session_model.hpp>

    #include "sync/interval_sync.hpp"
    #include "ui/commands/command_registry.hpp"
    #include "ui/commands/shortcut_manager.hpp"

namespace tracemark
{

namespace
{

constexpr float  kItemListWidth   = 240.0f;
constexpr float  kStatusBarHeight = 22.0f;
constexpr size_t kPolylineChunk   = 4000;   // Keeps each primitive under 16-bit indices
constexpr size_t kMarkerLimit     = 4000;   // Markers are skipped above this many points

// Axis <-> pixel mapping for one plot canvas.
struct PlotFrame
{
    ImVec2          min;
    ImVec2          max;
    sync::AxisRange x;
    sync::AxisRange y;

    float to_px(double ax) const
    {
        double w = x.width() != 0.0 ? x.width() : 1.0;
        return min.x + static_cast<float>((ax - x.min) / w) * (max.x - min.x);
    }

    float to_py(double ay) const
    {
        double h = y.width() != 0.0 ? y.width() : 1.0;
        return max.y - static_cast<float>((ay - y.min) / h) * (max.y - min.y);
    }

    double to_ax(float px) const
    {
        float w = max.x - min.x;
        return w > 0.0f ? x.min + (px - min.x) / w * x.width() : x.min;
    }
};

ImU32 to_imu32(const Color& c)
{
    return c.to_abgr();
}

std::string format_axis_value(double axis, const sync::IndexProjection& projection)
{
    char buf[64];
    if (projection.kind() == IndexKind::Time)
    {
        std::time_t t = static_cast<std::time_t>(std::floor(projection.to_domain(axis)));
        std::tm     tm{};
        gmtime_r(&t, &tm);
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    }
    else
    {
        std::snprintf(buf, sizeof(buf), "%.6g", axis);
    }
    return buf;
}

void draw_trace(ImDrawList*        dl,
                const PlotFrame&   frame,
                const sync::Trace& trace,
                bool               steps,
                bool               markers,
                float              line_width)
{
    if (trace.x.empty())
        return;

    ImU32               color = to_imu32(trace.color);
    std::vector<ImVec2> points;
    points.reserve(steps ? trace.x.size() * 2 : trace.x.size());
    for (size_t i = 0; i < trace.x.size(); ++i)
    {
        if (std::isnan(trace.y[i]))
            continue;
        ImVec2 p(frame.to_px(trace.x[i]), frame.to_py(trace.y[i]));
        if (steps && !points.empty())
            points.emplace_back(p.x, points.back().y);
        points.push_back(p);
    }

    for (size_t first = 0; first + 1 < points.size(); first += kPolylineChunk)
    {
        size_t count = std::min(kPolylineChunk + 1, points.size() - first);
        dl->AddPolyline(points.data() + first, static_cast<int>(count), color, 0, line_width);
    }

    if (markers && trace.x.size() <= kMarkerLimit)
    {
        for (size_t i = 0; i < trace.x.size(); ++i)
        {
            if (!std::isnan(trace.y[i]))
                dl->AddCircleFilled(ImVec2(frame.to_px(trace.x[i]), frame.to_py(trace.y[i])),
                                    2.5f,
                                    color);
        }
    }
}

}   // namespace

SessionPanels::SessionPanels(SessionModel&       model,
                             sync::IntervalSync& sync,
                             CommandRegistry&    commands,
                             ShortcutManager&    shortcuts,
                             const AppConfig&    config)
    : model_(model), sync_(sync), commands_(commands), shortcuts_(shortcuts), config_(config)
{
    connections_.connect(model_.events().item_removed,
                         [this](DataItem& item) { selected_.erase(&item); });
}

std::vector<DataItem*> SessionPanels::selected_items() const
{
    std::vector<DataItem*> out;
    for (const auto& item : model_.items())
    {
        if (selected_.count(item.get()))
            out.push_back(item.get());
    }
    return out;
}

void SessionPanels::draw()
{
    const ImGuiViewport* vp = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(vp->WorkPos);
    ImGui::SetNextWindowSize(vp->WorkSize);

    ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove
                             | ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_MenuBar
                             | ImGuiWindowFlags_NoBringToFrontOnFocus;
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(4.0f, 4.0f));
    ImGui::Begin("##tracemark", nullptr, flags);
    ImGui::PopStyleVar();

    draw_menu_bar();

    float body_height = ImGui::GetContentRegionAvail().y - kStatusBarHeight;

    ImGui::BeginChild("##items", ImVec2(kItemListWidth, body_height), true);
    draw_item_list();
    ImGui::EndChild();

    ImGui::SameLine();

    ImGui::BeginChild("##plots", ImVec2(0.0f, body_height), false);
    float plots_height = ImGui::GetContentRegionAvail().y;
    float spacing      = ImGui::GetStyle().ItemSpacing.y;
    draw_plot(sync_.outline(), PlotRole::Outline, std::floor(plots_height * 0.3f));
    draw_plot(sync_.detail(), PlotRole::Detail, plots_height * 0.7f - spacing);
    ImGui::EndChild();

    draw_status_bar();
    ImGui::End();
}

void SessionPanels::draw_menu_bar()
{
    if (!ImGui::BeginMenuBar())
        return;

    for (const auto& category : commands_.categories())
    {
        if (!ImGui::BeginMenu(category.c_str()))
            continue;
        for (const Command* cmd : commands_.commands_in_category(category))
        {
            Shortcut    bound    = shortcuts_.shortcut_for_command(cmd->id);
            std::string shortcut = bound.valid() ? bound.to_string() : std::string();
            bool        checked  = false;
            if (auto active = model_.active_label())
                checked = cmd->id == "label." + std::string(label_id(*active));
            if (ImGui::MenuItem(cmd->label.c_str(),
                                shortcut.empty() ? nullptr : shortcut.c_str(),
                                checked,
                                cmd->enabled))
                commands_.execute(cmd->id);
        }
        ImGui::EndMenu();
    }
    ImGui::EndMenuBar();
}

void SessionPanels::draw_item_list()
{
    ImGui::TextUnformatted("Items");
    ImGui::Separator();

    bool multi = ImGui::GetIO().KeyCtrl;
    for (const auto& owned : model_.items())
    {
        DataItem& item = *owned;
        ImGui::PushID(&item);

        bool visible = item.visible();
        if (ImGui::Checkbox("##visible", &visible))
            model_.set_item_visible(item, visible);
        ImGui::SameLine();

        ImVec2 pos = ImGui::GetCursorScreenPos();
        float  sz  = ImGui::GetTextLineHeight();
        ImGui::GetWindowDrawList()->AddRectFilled(ImVec2(pos.x, pos.y + 2.0f),
                                                  ImVec2(pos.x + sz, pos.y + sz - 2.0f),
                                                  to_imu32(item.color()));
        ImGui::Dummy(ImVec2(sz, sz));
        ImGui::SameLine();

        bool selected = selected_.count(&item) > 0;
        if (ImGui::Selectable(item.name().c_str(), selected))
        {
            if (!multi)
                selected_.clear();
            if (selected && multi)
                selected_.erase(&item);
            else
                selected_.insert(&item);
        }
        if (ImGui::IsItemHovered())
            ImGui::SetTooltip("%zu points, %zu markings",
                              item.series().size(),
                              item.markings().size());

        ImGui::PopID();
    }
}

void SessionPanels::draw_plot(sync::SpanView& view, PlotRole role, float height)
{
    ImVec2 size(ImGui::GetContentRegionAvail().x, std::max(height, 40.0f));
    ImGui::PushID(static_cast<int>(role));
    ImGui::InvisibleButton("##canvas",
                           size,
                           ImGuiButtonFlags_MouseButtonLeft | ImGuiButtonFlags_MouseButtonRight);
    bool hovered = ImGui::IsItemHovered();

    PlotFrame frame{ImGui::GetItemRectMin(), ImGui::GetItemRectMax(), view.xlim(), view.ylim()};
    ImDrawList* dl = ImGui::GetWindowDrawList();
    dl->PushClipRect(frame.min, frame.max, true);
    dl->AddRectFilled(frame.min, frame.max, IM_COL32(255, 255, 255, 255));

    for (const sync::SpanRecord* span : view.spans().all())
    {
        if (!span->visible)
            continue;
        dl->AddRectFilled(ImVec2(frame.to_px(span->x0), frame.min.y),
                          ImVec2(frame.to_px(span->x1), frame.max.y),
                          to_imu32(span->color));
    }

    bool steps   = role == PlotRole::Detail && sync_.detail().steps();
    bool markers = role == PlotRole::Detail && sync_.detail().markers();
    for (const auto& trace : view.traces())
    {
        if (trace.visible)
            draw_trace(dl, frame, trace, steps, markers, config_.line_width);
    }

    if (role == PlotRole::Outline)
    {
        if (auto sel = sync_.outline().selection())
        {
            dl->AddRect(ImVec2(frame.to_px(sel->min), frame.min.y + 1.0f),
                        ImVec2(frame.to_px(sel->max), frame.max.y - 1.0f),
                        IM_COL32(40, 40, 40, 200),
                        0.0f,
                        0,
                        2.0f);
        }
    }

    // ─── Mouse gestures ──────────────────────────────────────────────────────

    const ImGuiIO& io       = ImGui::GetIO();
    double         mouse_ax = frame.to_ax(io.MousePos.x);

    if (hovered && ImGui::IsMouseClicked(ImGuiMouseButton_Left))
    {
        if (io.KeyShift && role == PlotRole::Detail)
        {
            if (sync_.remove_span_at(mouse_ax))
                set_status("Marking removed");
        }
        else
        {
            drag_ = Drag{role, mouse_ax, mouse_ax};
        }
    }
    if (hovered && role == PlotRole::Detail && ImGui::IsMouseClicked(ImGuiMouseButton_Right))
    {
        if (!model_.active_label())
            set_status("Select a label first");
        else if (sync_.relabel_span_at(mouse_ax))
            set_status("Marking relabelled");
    }

    if (drag_ && drag_->role == role)
    {
        drag_->current = mouse_ax;
        dl->AddRectFilled(ImVec2(frame.to_px(drag_->start), frame.min.y),
                          ImVec2(frame.to_px(drag_->current), frame.max.y),
                          IM_COL32(120, 120, 120, 70));

        if (ImGui::IsMouseReleased(ImGuiMouseButton_Left))
        {
            Drag done = *drag_;
            drag_.reset();
            if (role == PlotRole::Outline)
                sync_.select_outline(done.start, done.current);
            else if (!model_.active_label())
                set_status("Select a label first");
            else
                sync_.select_detail(done.start, done.current);
        }
    }

    std::string left  = format_axis_value(frame.x.min, view.projection());
    std::string right = format_axis_value(frame.x.max, view.projection());
    ImU32       text  = IM_COL32(60, 60, 60, 255);
    float       ty    = frame.max.y - ImGui::GetTextLineHeight() - 2.0f;
    dl->AddText(ImVec2(frame.min.x + 4.0f, ty), text, left.c_str());
    float right_w = ImGui::CalcTextSize(right.c_str()).x;
    dl->AddText(ImVec2(frame.max.x - right_w - 4.0f, ty), text, right.c_str());

    dl->PopClipRect();
    dl->AddRect(frame.min, frame.max, IM_COL32(160, 160, 160, 255));
    ImGui::PopID();
}

void SessionPanels::draw_status_bar()
{
    std::string label = "none";
    if (auto active = model_.active_label())
        label = std::string(label_id(*active));

    ImGui::Separator();
    ImGui::Text("Label: %s", label.c_str());
    ImGui::SameLine();
    ImGui::Text("| Items: %zu", model_.item_count());
    if (auto interval = sync_.detail().interval())
    {
        const auto& proj = sync_.detail().projection();
        ImGui::SameLine();
        ImGui::Text("| %s .. %s",
                    format_axis_value(proj.to_axis(interval->first), proj).c_str(),
                    format_axis_value(proj.to_axis(interval->second), proj).c_str());
    }
    if (!status_.empty())
    {
        ImGui::SameLine();
        ImGui::Text("| %s", status_.c_str());
    }
}

}   // namespace tracemark

#endif   // TRACEMARK_USE_IMGUI
