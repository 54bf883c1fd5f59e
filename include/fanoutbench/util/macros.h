#pragma once

//
// Macros
//

#if defined(__GNUC__) || defined(__clang__)
#define HOT_PATH __attribute__((hot))
#else
#define HOT_PATH
#endif

#define UNLIKELY [[unlikely]]

#define NO_DISCARD [[nodiscard]]

//
// NO_MOVE_NO_COPY
//
//   Macro for classes that own threads, locks or borrowed handles and must stay put.
//
#define NO_MOVE_NO_COPY(ClassName)                   \
    ClassName(const ClassName&)            = delete; \
    ClassName& operator=(const ClassName&) = delete; \
    ClassName(ClassName&&)                 = delete; \
    ClassName& operator=(ClassName&&)      = delete

