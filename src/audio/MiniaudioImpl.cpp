// SPDX-License-Identifier: Apache-2.0

// The one translation unit that compiles the miniaudio implementation.
// AudioCapture and WavFile include <miniaudio.h> for declarations only.
#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>
