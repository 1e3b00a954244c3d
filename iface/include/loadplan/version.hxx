#ifndef LOADPLAN_VERSION_HXX
#define LOADPLAN_VERSION_HXX

#define STR_HELPER(x) #x
#define STR(x) STR_HELPER(x)

#ifndef LOADPLAN_PROJECT_NAME
#error Missing definition LOADPLAN_PROJECT_NAME
#endif

#ifndef LOADPLAN_VERSION_TWEAK
#define LOADPLAN_VERSION_TWEAK ""
#endif

#define LOADPLAN_VERSION_STRING                                                \
  (STR(LOADPLAN_VERSION_MAJOR) "." STR(LOADPLAN_VERSION_MINOR) "." STR(        \
    LOADPLAN_VERSION_PATCH) LOADPLAN_VERSION_TWEAK)
#endif
