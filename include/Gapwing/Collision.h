#pragma once

#include "Gapwing/Bird.h"
#include "Gapwing/Config.h"
#include "Gapwing/Pipe.h"

// True if the bird overlaps either half of any live pair
bool bird_hits_pipe(const Bird &bird, const PipeStream &pipes);

// True if the bird reached the ground band. The bird is then clamped so
// that its bottom edge rests on the ground line.
bool bird_touches_ground(Bird &bird, const GameConfig &config);

// Marks every pair whose center the bird has flown past and returns how
// many were newly marked. A pair is counted once, never per half.
int score_passed_pipes(const Bird &bird, PipeStream &pipes);
