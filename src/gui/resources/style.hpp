/**
 * @file    style.hpp
 * @brief   ImGui Style Configuration
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Neutral dark theme so the image is the brightest thing on screen,
 * with a warm accent for active controls.
 */

#pragma once

#include <imgui.h>

namespace loupe::gui {

namespace palette {

inline constexpr ImVec4 kBackground   = ImVec4(0.09f, 0.09f, 0.10f, 1.00f);
inline constexpr ImVec4 kPanel        = ImVec4(0.12f, 0.12f, 0.13f, 1.00f);
inline constexpr ImVec4 kFrame        = ImVec4(0.17f, 0.17f, 0.18f, 1.00f);
inline constexpr ImVec4 kFrameHover   = ImVec4(0.21f, 0.21f, 0.22f, 1.00f);
inline constexpr ImVec4 kBorder       = ImVec4(0.24f, 0.24f, 0.26f, 1.00f);
inline constexpr ImVec4 kText         = ImVec4(0.90f, 0.90f, 0.90f, 1.00f);
inline constexpr ImVec4 kTextDim      = ImVec4(0.55f, 0.55f, 0.57f, 1.00f);

inline constexpr ImVec4 kAccent       = ImVec4(0.95f, 0.65f, 0.25f, 1.00f);  // #F2A640
inline constexpr ImVec4 kAccentDim    = ImVec4(0.72f, 0.49f, 0.19f, 1.00f);
inline constexpr ImVec4 kAccentBg     = ImVec4(0.95f, 0.65f, 0.25f, 0.22f);

inline constexpr ImVec4 kError        = ImVec4(0.92f, 0.40f, 0.40f, 1.00f);
inline constexpr ImVec4 kMuted        = ImVec4(0.60f, 0.60f, 0.60f, 1.00f);

}  // namespace palette

/**
 * Apply the application's custom ImGui style
 */
inline void apply_style() {
    ImGuiStyle& style = ImGui::GetStyle();
    ImVec4* colors = style.Colors;

    // ==========================================================================
    // Sizing & Rounding
    // ==========================================================================
    style.WindowPadding = ImVec2(10, 10);
    style.FramePadding = ImVec2(8, 4);
    style.ItemSpacing = ImVec2(8, 6);
    style.ScrollbarSize = 12.0f;
    style.GrabMinSize = 14.0f;

    style.WindowRounding = 0.0f;
    style.ChildRounding = 3.0f;
    style.FrameRounding = 3.0f;
    style.PopupRounding = 3.0f;
    style.GrabRounding = 3.0f;

    style.WindowBorderSize = 0.0f;
    style.ChildBorderSize = 1.0f;
    style.FrameBorderSize = 0.0f;

    // ==========================================================================
    // Colors
    // ==========================================================================
    colors[ImGuiCol_Text]                 = palette::kText;
    colors[ImGuiCol_TextDisabled]         = palette::kTextDim;

    colors[ImGuiCol_WindowBg]             = palette::kBackground;
    colors[ImGuiCol_ChildBg]              = palette::kPanel;
    colors[ImGuiCol_PopupBg]              = palette::kPanel;
    colors[ImGuiCol_MenuBarBg]            = palette::kBackground;

    colors[ImGuiCol_Border]               = palette::kBorder;
    colors[ImGuiCol_BorderShadow]         = ImVec4(0.00f, 0.00f, 0.00f, 0.00f);

    colors[ImGuiCol_FrameBg]              = palette::kFrame;
    colors[ImGuiCol_FrameBgHovered]       = palette::kFrameHover;
    colors[ImGuiCol_FrameBgActive]        = palette::kFrameHover;

    colors[ImGuiCol_ScrollbarBg]          = palette::kBackground;
    colors[ImGuiCol_ScrollbarGrab]        = palette::kFrameHover;
    colors[ImGuiCol_ScrollbarGrabActive]  = palette::kAccentDim;

    colors[ImGuiCol_CheckMark]            = palette::kAccent;
    colors[ImGuiCol_SliderGrab]           = palette::kAccentDim;
    colors[ImGuiCol_SliderGrabActive]     = palette::kAccent;

    colors[ImGuiCol_Button]               = palette::kFrame;
    colors[ImGuiCol_ButtonHovered]        = palette::kAccentDim;
    colors[ImGuiCol_ButtonActive]         = palette::kAccent;

    // Tree nodes and selectables
    colors[ImGuiCol_Header]               = palette::kAccentBg;
    colors[ImGuiCol_HeaderHovered]        = ImVec4(0.95f, 0.65f, 0.25f, 0.35f);
    colors[ImGuiCol_HeaderActive]         = ImVec4(0.95f, 0.65f, 0.25f, 0.50f);

    colors[ImGuiCol_Separator]            = palette::kBorder;
    colors[ImGuiCol_TextSelectedBg]       = palette::kAccentBg;
    colors[ImGuiCol_NavHighlight]         = palette::kAccent;
    colors[ImGuiCol_ModalWindowDimBg]     = ImVec4(0.00f, 0.00f, 0.00f, 0.60f);
}

}  // namespace loupe::gui
