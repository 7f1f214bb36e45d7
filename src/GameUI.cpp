#include "Gapwing/GameUI.h"
#include "Gapwing/GWCommon.h"
#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_sdlrenderer3.h"
#include <cfloat>
#include <cstdio>

static constexpr float SCORE_FONT_SIZE = 64.0f;
static constexpr float BANNER_FONT_SIZE = 64.0f;
static constexpr float HINT_FONT_SIZE = 32.0f;
static constexpr float SCORE_Y = 50.0f;

static const ImU32 TEXT_WHITE = IM_COL32(255, 255, 255, 255);
static const ImU32 TEXT_SHADOW = IM_COL32(0, 0, 0, 255);
static const ImU32 TEXT_RED = IM_COL32(200, 0, 0, 255);
static const ImU32 TEXT_GREY = IM_COL32(200, 200, 200, 255);

bool ui_init(SDL_Window *window, SDL_Renderer *renderer) {
  IMGUI_CHECKVERSION();
  ImGui::CreateContext();
  ImGuiIO &io = ImGui::GetIO();
  io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
  io.IniFilename = nullptr;

  ImGui::StyleColorsDark();
  if (!ImGui_ImplSDL3_InitForSDLRenderer(window, renderer) ||
      !ImGui_ImplSDLRenderer3_Init(renderer)) {
    GWLOG("Failed to initialize ImGui backends");
    ImGui::DestroyContext();
    return false;
  }
  return true;
}

void ui_shutdown() {
  ImGui_ImplSDLRenderer3_Shutdown();
  ImGui_ImplSDL3_Shutdown();
  ImGui::DestroyContext();
}

void ui_process_event(SDL_Event *event) { ImGui_ImplSDL3_ProcessEvent(event); }

void ui_new_frame() {
  ImGui_ImplSDLRenderer3_NewFrame();
  ImGui_ImplSDL3_NewFrame();
  ImGui::NewFrame();
}

// Centered text with a drop shadow, drawn straight into the foreground list
static void draw_centered_text(ImDrawList *list, const char *text,
                               float font_size, ImVec2 center, ImU32 color,
                               ImU32 shadow, float shadow_offset) {
  ImFont *font = ImGui::GetFont();
  ImVec2 size = font->CalcTextSizeA(font_size, FLT_MAX, 0.0f, text);
  ImVec2 pos(center.x - size.x / 2.0f, center.y - size.y / 2.0f);
  list->AddText(font, font_size,
                ImVec2(pos.x + shadow_offset, pos.y + shadow_offset), shadow,
                text);
  list->AddText(font, font_size, pos, color, text);
}

void ui_render(const RenderSnapshot &snapshot, int screen_width,
               int screen_height) {
  ImDrawList *list = ImGui::GetForegroundDrawList();
  float cx = screen_width / 2.0f;
  float cy = screen_height / 2.0f;

  if (snapshot.state == GameStateEnum::GAME_STATE_PLAYING) {
    char score_text[16];
    snprintf(score_text, sizeof(score_text), "%d", snapshot.score);
    draw_centered_text(list, score_text, SCORE_FONT_SIZE, ImVec2(cx, SCORE_Y),
                       TEXT_WHITE, TEXT_SHADOW, 3.0f);
  } else {
    draw_centered_text(list, "Game Over", BANNER_FONT_SIZE,
                       ImVec2(cx, cy - 50.0f), TEXT_WHITE, TEXT_RED, 3.0f);
    draw_centered_text(list, "Press Space to Restart", HINT_FONT_SIZE,
                       ImVec2(cx, cy + 50.0f), TEXT_GREY, TEXT_WHITE, 2.0f);
  }
}

void ui_present(SDL_Renderer *renderer) {
  ImGui::Render();
  ImGui_ImplSDLRenderer3_RenderDrawData(ImGui::GetDrawData(), renderer);
}
