#ifndef SERVICE_VERSION_H
#define SERVICE_VERSION_H

/// Conventional string-ification macro.
// From: http://stackoverflow.com/questions/5256313/c-c-macro-string-concatenation
#if !defined(VSL_STRINGIZE)
    #define VSL_STRINGIZEIMPL(x) #x
    #define VSL_STRINGIZE(x)     VSL_STRINGIZEIMPL(x)
#endif

// Current version of this SERVICE
#define VSL_SERVICE_VERSION_PRODUCT 0
#define VSL_SERVICE_VERSION_MAJOR   1
#define VSL_SERVICE_VERSION_MINOR   0
#define VSL_SERVICE_VERSION_HOTFIX  0

/// "Product.Major.Minor.Hotfix"
#if !defined(VSL_SERVICE_VERSION_STRING)
    #define VSL_SERVICE_VERSION_STRING VSL_STRINGIZE(VSL_SERVICE_VERSION_PRODUCT.VSL_SERVICE_VERSION_MAJOR.VSL_SERVICE_VERSION_MINOR.VSL_SERVICE_VERSION_HOTFIX)
#endif

#endif // SERVICE_VERSION_H
