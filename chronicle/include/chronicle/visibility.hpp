/** Defines a CHRONICLE_PUBLIC visibility attribute macro, used on all public interfaces.
 *  Define it before including `chronicle.hpp` to control symbol visibility directly.
 *  Otherwise symbols are exported from the translation unit that defines
 *  CHRONICLE_IMPLEMENTATION and imported everywhere else.
 */
#ifndef CHRONICLE_PUBLIC
#  if defined _WIN32 || defined __CYGWIN__
#    ifdef __GNUC__
#      define CHRONICLE_EXPORT __attribute__((dllexport))
#      define CHRONICLE_IMPORT __attribute__((dllimport))
#    else
#      define CHRONICLE_EXPORT __declspec(dllexport)
#      define CHRONICLE_IMPORT __declspec(dllimport)
#    endif
#    ifdef CHRONICLE_IMPLEMENTATION
#      define CHRONICLE_PUBLIC CHRONICLE_EXPORT
#    else
#      define CHRONICLE_PUBLIC CHRONICLE_IMPORT
#    endif
#  else
#    define CHRONICLE_EXPORT __attribute__((visibility("default")))
#    define CHRONICLE_IMPORT
#    if __GNUC__ >= 4
#      define CHRONICLE_PUBLIC __attribute__((visibility("default")))
#    else
#      define CHRONICLE_PUBLIC
#    endif
#  endif
#endif
