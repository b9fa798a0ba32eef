#include <preview/diagram_preview.hpp>
#include <diagram_layout/layout_engine.hpp>
#include <spdlog/spdlog.h>
#include "imgui.h"
#include <algorithm>
#include <cmath>

namespace preview {

namespace {

// Spreadsheet rows are taller than the glyphs; keep the same proportion on screen.
const float row_height_ratio = 1.35f;
const float min_zoom = 0.4f;
const float max_zoom = 4.0f;

} // namespace

DiagramPreview::DiagramPreview() = default;

DiagramPreview::~DiagramPreview() = default;

void DiagramPreview::set_request(const diagram_model::DiagramRequest* request) {
    request_ = request;
    if (request_) {
        width_ = std::clamp(request_->width, diagram_layout::layout::min_width, diagram_layout::layout::max_width);
        frame_ = request_->frame;
        strict_ = request_->strict;
    }
    dirty_ = true;
}

const diagram_model::DiagramRequest* DiagramPreview::request() const {
    return request_;
}

bool DiagramPreview::take_reload_request() {
    const bool requested = reload_requested_;
    reload_requested_ = false;
    return requested;
}

void DiagramPreview::pan(float dx, float dy) {
    offset_x_ += dx;
    offset_y_ += dy;
}

void DiagramPreview::zoom_at(float screen_x, float screen_y, float zoom_delta) {
    const float new_zoom = std::clamp(zoom_ * zoom_delta, min_zoom, max_zoom);
    const float applied = new_zoom / zoom_;
    offset_x_ = screen_x - (screen_x - offset_x_) * applied;
    offset_y_ = screen_y - (screen_y - offset_y_) * applied;
    zoom_ = new_zoom;
}

void DiagramPreview::relayout() {
    if (!request_) {
        lines_.clear();
        dirty_ = false;
        return;
    }
    lines_ = diagram_layout::layout_diagram(request_->elements, width_, frame_);
    spdlog::debug("preview laid out {} lines at width {} (frame={})", lines_.size(), width_, frame_);
    dirty_ = false;
}

void DiagramPreview::draw_controls() {
    if (ImGui::SliderInt("Width", &width_, diagram_layout::layout::min_width, diagram_layout::layout::max_width))
        dirty_ = true;
    ImGui::SameLine();
    if (ImGui::Checkbox("Frame", &frame_))
        dirty_ = true;
    ImGui::SameLine();
    if (ImGui::Checkbox("Strict", &strict_))
        reload_requested_ = true;
    ImGui::SameLine();
    ImGui::Checkbox("Gridlines", &show_gridlines_);
    ImGui::SameLine();
    if (ImGui::Button("Reload"))
        reload_requested_ = true;

    ImGui::Text("%zu rows, widest %d cells", lines_.size(), diagram_layout::diagram_width(lines_));
    if (!status_.empty()) {
        ImGui::SameLine();
        ImGui::TextUnformatted(status_.c_str());
    }
}

void DiagramPreview::draw_gridlines(ImVec2 region_min, ImVec2 region_max, float cell_w, float row_h) {
    ImDrawList* dl = ImGui::GetWindowDrawList();
    if (!dl || row_h <= 0.0f) return;

    const unsigned int grid_color = IM_COL32(60, 60, 65, 255);
    const float grid_thickness = 1.0f;

    // Row boundaries across the whole region, aligned to the diagram origin.
    const float origin_y = region_min.y + offset_y_;
    float start_y = origin_y - std::ceil((origin_y - region_min.y) / row_h) * row_h;
    for (float y = start_y; y <= region_max.y; y += row_h)
        dl->AddLine(ImVec2(region_min.x, y), ImVec2(region_max.x, y), grid_color, grid_thickness);

    // The single column holding the diagram.
    const float col_left = region_min.x + offset_x_;
    const float col_right = col_left + cell_w * static_cast<float>(std::max(diagram_layout::diagram_width(lines_), 1));
    dl->AddLine(ImVec2(col_left, region_min.y), ImVec2(col_left, region_max.y), grid_color, grid_thickness);
    dl->AddLine(ImVec2(col_right, region_min.y), ImVec2(col_right, region_max.y), grid_color, grid_thickness);
}

void DiagramPreview::handle_input(float region_width, float region_height) {
    ImGuiIO& io = ImGui::GetIO();
    ImVec2 mouse = io.MousePos;
    ImVec2 win_min = ImGui::GetCursorScreenPos();
    ImVec2 win_max = ImVec2(win_min.x + region_width, win_min.y + region_height);

    bool in_region = mouse.x >= win_min.x && mouse.x <= win_max.x &&
                     mouse.y >= win_min.y && mouse.y <= win_max.y;

    if (ImGui::IsMouseClicked(0) && in_region && !ImGui::IsAnyItemActive()) {
        dragging_ = true;
        drag_start_x_ = mouse.x;
        drag_start_y_ = mouse.y;
        drag_start_offset_x_ = offset_x_;
        drag_start_offset_y_ = offset_y_;
    }
    if (ImGui::IsMouseReleased(0))
        dragging_ = false;

    if (dragging_) {
        offset_x_ = drag_start_offset_x_ + (mouse.x - drag_start_x_);
        offset_y_ = drag_start_offset_y_ + (mouse.y - drag_start_y_);
    }

    if (in_region && io.MouseWheel != 0.0f) {
        float factor = io.MouseWheel > 0 ? 1.2f : 1.0f / 1.2f;
        zoom_at(mouse.x - win_min.x, mouse.y - win_min.y, factor);
    }
}

bool DiagramPreview::update_and_draw(float region_width, float region_height) {
    if (region_width <= 0 || region_height <= 0) return false;

    draw_controls();
    if (dirty_) relayout();

    const ImVec2 avail = ImGui::GetContentRegionAvail();
    const float canvas_w = std::min(region_width, avail.x);
    const float canvas_h = std::max(avail.y, 0.0f);
    if (canvas_w <= 0 || canvas_h <= 0) return true;

    handle_input(canvas_w, canvas_h);

    ImVec2 region_min = ImGui::GetCursorScreenPos();
    ImVec2 region_max = ImVec2(region_min.x + canvas_w, region_min.y + canvas_h);

    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    if (!draw_list) return true;

    ImFont* font = ImGui::GetFont();
    const float font_size = ImGui::GetFontSize() * zoom_;
    const float cell_w = ImGui::CalcTextSize("M").x * zoom_;
    const float row_h = font_size * row_height_ratio;

    draw_list->PushClipRect(region_min, region_max, true);
    if (show_gridlines_)
        draw_gridlines(region_min, region_max, cell_w, row_h);

    const unsigned int text_color = IM_COL32(220, 220, 220, 255);
    const float text_inset = (row_h - font_size) * 0.5f;
    for (std::size_t i = 0; i < lines_.size(); ++i) {
        const float y = region_min.y + offset_y_ + row_h * static_cast<float>(i);
        if (y + row_h < region_min.y || y > region_max.y) continue;
        const ImVec2 pos(region_min.x + offset_x_, y + text_inset);
        draw_list->AddText(font, font_size, pos, text_color, lines_[i].c_str());
    }
    draw_list->PopClipRect();

    ImGui::Dummy(ImVec2(canvas_w, canvas_h));
    return true;
}

} // namespace preview
