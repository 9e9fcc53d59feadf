// Album metadata tagger
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include "albumtag/albumtag.h"

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

void albumtag_release_error(const char* p) {
    delete[] p;
}

};
