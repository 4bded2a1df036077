#pragma once

// Tracy zones for the hot paths (allocation, prediction, scoring, stream pulls)
//
//   SWITCHBOARD_ZONE              whole function
//   SWITCHBOARD_ZONE_N(name)      whole function, custom name
//   SWITCHBOARD_ZONE_SCOPED(name) inner scope
//   SWITCHBOARD_FRAME_MARK        frame boundary in benchmarks
//
// Without TRACY_ENABLE every macro compiles to nothing.

#ifdef TRACY_ENABLE

#  include <tracy/Tracy.hpp>

#  define SWITCHBOARD_ZONE ZoneScoped
#  define SWITCHBOARD_ZONE_N(name) ZoneScopedN(name)
#  define SWITCHBOARD_ZONE_SCOPED(name) ZoneScopedNC(name, tracy::Color::Orange)
#  define SWITCHBOARD_FRAME_MARK FrameMark

#else

#  define SWITCHBOARD_ZONE
#  define SWITCHBOARD_ZONE_N(name)
#  define SWITCHBOARD_ZONE_SCOPED(name) (void)0
#  define SWITCHBOARD_FRAME_MARK

#endif
