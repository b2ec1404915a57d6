#pragma once

#include "ViewTransform.hpp"

#include <QHash>
#include <QString>
#include <QStringList>
#include <array>
#include <cstdint>
#include <tuple>

struct Config
{
    QHash<QString, QString> shortcuts{};

    struct colors
    {
        uint32_t background{0xFAFAFAFF};
        uint32_t text{0x141414FF};
        uint32_t form_label{0x00008BFF};
        uint32_t form_field{0x3C3C3CFF};
        uint32_t checkbox{0x282828FF};
        uint32_t search_match{0xFFA500FF};
        uint32_t search_highlight{0xFFFF003C};
        uint32_t hover{0x3B82F6FF};
        uint32_t column_guide{0x3B82F63C};
        uint32_t status{0x646464FF};
        uint32_t status_hover{0x505050FF};
        uint32_t hint{0x787878FF};
        uint32_t toast{0x10B981FF};
        uint32_t message_error{0xDC2626FF};
    } colors{};

    struct window
    {
        bool fullscreen{false};
        bool menubar{true};
        bool page_panel{true};
        QString title_format{"%1 - chonker"};
        std::tuple<int, int> initial_size{-1,
                                          -1}; // width, height; -1 for default
    } window{};

    struct statusbar
    {
        bool visible{true};
        std::array<int, 4> padding{5, 5, 5, 5}; // top, right, bottom, left
        bool file_name_only{true};
        bool show_page_number{true};
        bool show_item_count{true};
        bool show_mode{true};
    } statusbar{};

    struct zoom
    {
        float level{1.0f};
        float factor{1.2f};
        float min{0.5f};
        float max{3.0f};
        float wheel_factor{0.001f};
        float pan_step{40.0f};
    } zoom{};

    struct canvas
    {
        ViewTransform::Origin origin{ViewTransform::Origin::TopLeft};
        ViewTransform::Fit fit{ViewTransform::Fit::Uniform};
        float margin_x{20.0f};
        float margin_y{50.0f};
        int wrap_threshold{50};
        QStringList wrap_triggers{QStringLiteral("must be signed")};
        float wrap_cap_width{400.0f};
        float min_wrap_width{50.0f};
        float fallback_width{40.0f};
        float min_font_size{8.0f};
        float max_font_size{24.0f};
        int max_lines{10};
        float hit_padding{2.0f};
        int drag_threshold{4};
        int toast_duration_ms{2000};
        int toast_preview_length{50};
        bool column_guides{true};
    } canvas{};

    struct extraction
    {
        QString command{"python3"};
        QStringList args{QStringLiteral("chonker2.py")};
        int timeout_ms{300000};
        bool auto_extract{false};
        int poll_interval_ms{16};
    } extraction{};

    struct rendering
    {
        bool page_image{true};
        float dpi{72.0f};
        bool antialiasing{true};
        bool text_antialiasing{true};
        bool smooth_pixmap_transform{true};
    } rendering{};

    struct behavior
    {
        int startpage_override{-1};
        bool edit_mode{false};
        bool clear_overrides_on_new_source{true};
    } behavior{};
};
