// src/core/Profile.h
#pragma once

// Tracy (optional): POWERGRID_ENABLE_TRACY defines TRACY_ENABLE and links TracyClient.
#if defined(TRACY_ENABLE)
  #include <tracy/Tracy.hpp>
  #define PG_TRACY 1
#else
  #define PG_TRACY 0
#endif

#if PG_TRACY
  #define PG_ZONE(name_literal)        ZoneScopedN(name_literal)
  #define PG_FRAME_MARK()              FrameMark
  #define PG_PLOT(name_literal, val)   TracyPlot(name_literal, val)
#else
  #define PG_ZONE(name_literal)        do{}while(0)
  #define PG_FRAME_MARK()              do{}while(0)
  #define PG_PLOT(name_literal, val)   do{}while(0)
#endif
