#pragma once

// Scope instrumentation. Build with SKIRMISH_ENABLE_TRACY=ON (which defines
// TRACY_ENABLE and links Tracy::TracyClient) to emit zones; otherwise the
// macros compile to nothing.
//   void Encounter::tick(float dt) { SKIRMISH_TRACY_ZONE("Encounter::tick"); ... }

#if defined(TRACY_ENABLE)
  #include <tracy/Tracy.hpp>
  #define SKIRMISH_TRACY_ZONE(name) ZoneScopedN(name)
  #define SKIRMISH_TRACY_FRAME() FrameMark
#else
  #define SKIRMISH_TRACY_ZONE(name) ((void)0)
  #define SKIRMISH_TRACY_FRAME() ((void)0)
#endif
