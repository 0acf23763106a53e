#ifndef FS_LOG_H
#define FS_LOG_H

#include <string>

/* Diagnostic sink handed to the flash filesystem code.
 *
 * Logging is purely observational: nothing in core/ changes its result
 * depending on whether a logger is present. Callers pass nullptr when
 * they do not care about the trail. */
class FsLogger
{
public:
    virtual ~FsLogger() = default;

    virtual void log(const std::string &message) = 0;
    virtual void warn(const std::string &message) { log(message); }
    virtual void error(const std::string &message) = 0;
};

#endif // FS_LOG_H
