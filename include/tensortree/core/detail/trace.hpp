#pragma once

// Insert Tracy scope statements if tracing is enabled
#ifndef TT_ENABLE_TRACY
  #define tt_trace()
  #define tt_trace_n(name)
  #define tt_trace_frame()
#else // TT_ENABLE_TRACY
  #include <tracy/Tracy.hpp>

  // Insert CPU event trace
  #define tt_trace()            ZoneScoped;
  #define tt_trace_n(name)      ZoneScopedN(name)

  // Signal end of frame for event trace; the lookup tool treats one query as a frame
  #define tt_trace_frame()      FrameMark;

  #ifndef TRACY_ENABLE
    #define TRACY_ENABLE
  #endif // TRACY_ENABLE
  #ifndef TRACY_ON_DEMAND
  #define TRACY_ON_DEMAND
  #endif // TRACY_ON_DEMAND
#endif // TT_ENABLE_TRACY
