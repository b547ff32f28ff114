#ifndef INTENTNN_CONSOLE_H
#define INTENTNN_CONSOLE_H

#include <iostream>
#include <iomanip>
#include <string>

// ANSI colors
#define INTENTNN_RESET "\033[0m"
#define INTENTNN_BOLD "\033[1m"
#define INTENTNN_GREEN "\033[32m"
#define INTENTNN_YELLOW "\033[33m"
#define INTENTNN_CYAN "\033[36m"
#define INTENTNN_RED "\033[31m"
#define INTENTNN_BLUE "\033[34m"
#define INTENTNN_MAGENTA "\033[35m"

inline void printHeader(const std::string& title, std::ostream& os = std::cout) {
    os << "\n" << INTENTNN_BOLD << INTENTNN_CYAN;
    os << "╔══════════════════════════════════════════════════════════════╗\n";
    os << "║  " << std::setw(60) << std::left << title << "║\n";
    os << "╚══════════════════════════════════════════════════════════════╝";
    os << INTENTNN_RESET << std::right << "\n\n";
}

inline void printProgress(const std::string& message, bool success = true,
                          std::ostream& os = std::cout) {
    os << (success ? INTENTNN_GREEN "  ✓ " : INTENTNN_RED "  ✗ ") << INTENTNN_RESET
       << message << "\n";
}

inline void printWarning(const std::string& message, std::ostream& os = std::cerr) {
    os << INTENTNN_YELLOW << "  ! " << INTENTNN_RESET << message << "\n";
}

inline void printError(const std::string& message, std::ostream& os = std::cerr) {
    os << INTENTNN_RED << "Error: " << message << INTENTNN_RESET << "\n";
}

#endif // INTENTNN_CONSOLE_H
