#ifndef AZUPLOAD_MYLOGGER_HPP
#define AZUPLOAD_MYLOGGER_HPP

#include <iostream>
#include <string>

namespace azupload
{

#ifdef AZUPLOAD_DEBUG
    inline constexpr bool kDebugLogging = true;
#else
    inline constexpr bool kDebugLogging = false;
#endif

    class MyLogger
    {
    public:
        static void debug(const std::string &msg)
        {
            if (kDebugLogging)
            {
                std::cout << "\033[1;94m[DEBUG] " << msg << "\033[0m" << std::endl; // Light blue
            }
        }
        static void info(const std::string &msg)
        {
            std::cout << "\033[1;32m[INFO] " << msg << "\033[0m" << std::endl; // Light green
        }
        static void warning(const std::string &msg)
        {
            std::cout << "\033[1;33m[WARNING] " << msg << "\033[0m" << std::endl; // Yellow
        }
        static void error(const std::string &msg)
        {
            std::cerr << "\033[1;35m[ERROR] " << msg << "\033[0m" << std::endl; // Magenta
        }
    };

} // namespace azupload

#endif // AZUPLOAD_MYLOGGER_HPP
