#include <diagram_loaders/demo_request.hpp>
#include <initializer_list>
#include <utility>
#include <vector>

namespace diagram_loaders {

diagram_model::DiagramRequest generate_demo_request() {
    diagram_model::DiagramRequest out;
    out.width = 64;
    out.frame = true;

    auto box = [](std::initializer_list<const char*> lines, const char* comment = "") {
        diagram_model::BoxElement b;
        b.lines.assign(lines.begin(), lines.end());
        b.comment = comment;
        return b;
    };
    auto row_box = [](std::initializer_list<const char*> lines) {
        diagram_model::RowBox b;
        b.lines.assign(lines.begin(), lines.end());
        return b;
    };
    auto data = [](std::initializer_list<std::pair<const char*, double>> pairs) {
        std::vector<diagram_model::BarDatum> out;
        for (const auto& p : pairs)
            out.push_back(diagram_model::BarDatum{ p.first, p.second });
        return out;
    };

    auto& e = out.elements;
    e.push_back(diagram_model::TitleElement{ "Order pipeline" });
    e.push_back(diagram_model::SpacerElement{});
    e.push_back(box({ "Storefront", "web + mobile" }, "entry point"));
    e.push_back(diagram_model::ArrowElement{});
    e.push_back(box({ "Order service" }));
    e.push_back(diagram_model::ArrowElement{});

    diagram_model::RowElement row;
    row.boxes = { row_box({ "Payments" }), row_box({ "Inventory" }), row_box({ "Shipping", "(async)" }) };
    row.merge = true;
    e.push_back(row);
    e.push_back(diagram_model::ArrowElement{});
    e.push_back(box({ "Ledger" }));
    e.push_back(diagram_model::SpacerElement{});

    e.push_back(diagram_model::TitleElement{ "Throughput" });
    diagram_model::TextElement caption;
    caption.text = "orders per day";
    caption.x = 2;
    caption.comment = "last week";
    e.push_back(caption);
    diagram_model::BarChartElement bars;
    bars.data = data({ { "Mon", 1250 }, { "Tue", 980.5 }, { "Wed", 1420 }, { "Thu", 610 } });
    bars.bar_width = 24;
    bars.x = 2;
    e.push_back(bars);
    e.push_back(diagram_model::SpacerElement{});

    diagram_model::VerticalBarChartElement columns;
    columns.data = data({ { "Q1", 12 }, { "Q2", 19 }, { "Q3", 7 }, { "Q4", 23 } });
    columns.bar_height = 5;
    columns.bar_width = 4;
    columns.x = 2;
    e.push_back(columns);
    e.push_back(diagram_model::SpacerElement{});

    diagram_model::SparklineElement spark;
    spark.data = { 3, 5, 2, 8, 13, 9, 4, 6, 11, 7 };
    spark.label = "latency";
    spark.x = 2;
    e.push_back(spark);

    diagram_model::ProgressElement progress;
    progress.value = 68;
    progress.width = 30;
    progress.label = "rollout";
    progress.x = 2;
    e.push_back(progress);
    e.push_back(diagram_model::SpacerElement{});

    diagram_model::ShadedBoxElement shaded;
    shaded.width = 30;
    shaded.height = 5;
    shaded.title = "load";
    shaded.direction = diagram_model::ShadeDirection::Radial;
    shaded.contrast = 0.7;
    shaded.box_style = "rounded";
    shaded.x = 2;
    e.push_back(shaded);
    e.push_back(diagram_model::SpacerElement{});

    diagram_model::TableElement table;
    table.headers = { "Service", "Owner", "SLO" };
    table.rows = { { "orders", "checkout", "99.9%" }, { "payments", "billing", "99.95%" }, { "ledger", "finance", "99.99%" } };
    table.box_style = "double";
    table.x = 2;
    e.push_back(table);

    return out;
}

} // namespace diagram_loaders
