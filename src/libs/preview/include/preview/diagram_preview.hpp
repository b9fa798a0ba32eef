#pragma once

#include <diagram_model/types.hpp>
#include <string>
#include <utility>

struct ImVec2;

namespace preview {

// Shows a rendered diagram the way the spreadsheet will: one line per row in a
// single monospace column. Width and frame can be changed live; the diagram is
// re-laid out whenever they change.
class DiagramPreview {
public:
    DiagramPreview();
    ~DiagramPreview();

    void set_request(const diagram_model::DiagramRequest* request);
    const diagram_model::DiagramRequest* request() const;

    void set_status(std::string status) { status_ = std::move(status); }

    int width() const { return width_; }
    bool frame() const { return frame_; }
    bool strict() const { return strict_; }
    const diagram_model::Diagram& lines() const { return lines_; }

    // True once after the user pressed Reload or toggled strict mode.
    bool take_reload_request();

    void pan(float dx, float dy);
    void zoom_at(float screen_x, float screen_y, float zoom_delta);

    bool update_and_draw(float region_width, float region_height);

private:
    const diagram_model::DiagramRequest* request_ = nullptr;
    diagram_model::Diagram lines_;
    std::string status_;
    int width_ = 60;
    bool frame_ = false;
    bool strict_ = false;
    bool show_gridlines_ = true;
    bool dirty_ = true;
    bool reload_requested_ = false;
    float offset_x_ = 16.0f;
    float offset_y_ = 16.0f;
    float zoom_ = 1.0f;
    bool dragging_ = false;
    float drag_start_x_ = 0;
    float drag_start_y_ = 0;
    float drag_start_offset_x_ = 0;
    float drag_start_offset_y_ = 0;

    void relayout();
    void draw_controls();
    void draw_gridlines(ImVec2 region_min, ImVec2 region_max, float cell_w, float row_h);
    void handle_input(float region_width, float region_height);
};

} // namespace preview
