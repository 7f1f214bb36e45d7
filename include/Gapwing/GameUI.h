// GameUI.h
#pragma once

#include "Gapwing/GameState.h"
#include <SDL3/SDL.h>

// UI initialization and cleanup
bool ui_init(SDL_Window *window, SDL_Renderer *renderer);
void ui_shutdown();

// Process events for ImGui
void ui_process_event(SDL_Event *event);

// Start a new ImGui frame
void ui_new_frame();

// Score while playing, the game over banner otherwise
void ui_render(const RenderSnapshot &snapshot, int screen_width,
               int screen_height);

// Submit the frame's draw data to the renderer
void ui_present(SDL_Renderer *renderer);
