#ifndef VSLCLIENT_EXPORT_H
#define VSLCLIENT_EXPORT_H

/** \def VSL_CALL
 * Calling convention of the VSLService C API. __cdecl on Windows, nothing elsewhere.
 */
#ifndef VSL_CALL
    #if defined _WIN32 || defined __CYGWIN__
        #define VSL_CALL __cdecl
    #else
        #define VSL_CALL
    #endif
#endif

#ifndef VSL_EXTERN_C
    #ifdef __cplusplus
        #define VSL_EXTERN_C extern "C"
    #else
        #define VSL_EXTERN_C
    #endif
#endif

#ifndef VSL_PUBLIC_FUNCTION
    #if defined(VSLService_EXPORTS)  // CMake-defined when creating shared library
        #if defined _WIN32 || defined __CYGWIN__
            #define VSL_PUBLIC_FUNCTION(rval)       VSL_EXTERN_C    __declspec(dllexport)                   rval    VSL_CALL
            #define VSL_PUBLIC_CLASS                                __declspec(dllexport)
            #define VSL_PRIVATE_FUNCTION(rval)                                                              rval    VSL_CALL
            #define VSL_PRIVATE_CLASS
        #else  // Not Windows
            #if __GNUC__ >= 4
                #define VSL_PUBLIC_FUNCTION(rval)   VSL_EXTERN_C    __attribute__((visibility("default")))  rval    VSL_CALL
                #define VSL_PUBLIC_CLASS                            __attribute__((visibility("default")))
            #else
                #define VSL_PUBLIC_FUNCTION(rval)   VSL_EXTERN_C rval VSL_CALL
                #define VSL_PUBLIC_CLASS
            #endif
            #define VSL_PRIVATE_FUNCTION(rval)                      __attribute__((visibility("hidden")))   rval    VSL_CALL
            #define VSL_PRIVATE_CLASS                               __attribute__((visibility("hidden")))
        #endif  //defined _WIN32 || defined __CYGWIN__
    #elif defined(VSLService_STATIC) // CMake-defined when creating static library
        #define VSL_PUBLIC_FUNCTION(rval)           VSL_EXTERN_C                                            rval    VSL_CALL
        #define VSL_PUBLIC_CLASS
        #define VSL_PRIVATE_FUNCTION(rval)                                                                  rval    VSL_CALL
        #define VSL_PRIVATE_CLASS
    #else //This DLL/so/dylib is being imported
        #if defined _WIN32 || defined __CYGWIN__
            #define VSL_PUBLIC_FUNCTION(rval)       VSL_EXTERN_C    __declspec(dllimport)                   rval    VSL_CALL
            #define VSL_PUBLIC_CLASS                                __declspec(dllimport)
        #else  // Not Windows
            #define VSL_PUBLIC_FUNCTION(rval)       VSL_EXTERN_C                                            rval    VSL_CALL
            #define VSL_PUBLIC_CLASS
        #endif  //defined _WIN32 || defined __CYGWIN__
        #define VSL_PRIVATE_FUNCTION(rval)                                                                  rval    VSL_CALL
        #define VSL_PRIVATE_CLASS
    #endif //VSLService_EXPORTS
#endif //!defined(VSL_PUBLIC_FUNCTION)

#endif // VSLCLIENT_EXPORT_H