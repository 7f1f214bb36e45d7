#pragma once

#include <SDL3/SDL.h>

#ifdef GW_CONFIG_LOG
#define GWLOG(...) SDL_Log(__VA_ARGS__)
#else
#define GWLOG(...)
#endif // GW_CONFIG_LOG
