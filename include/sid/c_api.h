/* include/sid/c_api.h
 *
 * C binding. Scripts are exchanged as their ordinal (alphabetical order,
 * 0 = Arabic ... 23 = Thai).
 */
#ifndef SID_C_API_H
#define SID_C_API_H

#include <stddef.h>

#if defined(_WIN32)
    #define SID_EXPORT __declspec(dllexport)
#else
    #define SID_EXPORT __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C" {
#endif

/* Dominant script ordinal of len bytes of UTF-8, or -1 when none */
SID_EXPORT int sid_detect_script(const char* utf8, size_t len);

/* Display name for an ordinal, or NULL when out of range */
SID_EXPORT const char* sid_script_name(int ordinal);

SID_EXPORT int sid_script_count(void);

#ifdef __cplusplus
}
#endif

#endif /* SID_C_API_H */
