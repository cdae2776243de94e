#ifndef BIBSANE_SRC_COMMON_VERDICT_H_
#define BIBSANE_SRC_COMMON_VERDICT_H_

#include <ostream>

namespace BibSane {

/**
 * Outcome of processing one aux file. The numeric value is the process exit
 * status; the ordering UNCHANGED < CHANGED < BROKEN is used for downgrades.
 */
enum class Verdict : int {
    UNCHANGED = 0,
    CHANGED = 1,
    BROKEN = 2
};

// A stage can only move the verdict towards BROKEN, never back.
inline Verdict Downgrade(Verdict current, Verdict proposed) {
    return static_cast<int>(proposed) > static_cast<int>(current) ? proposed : current;
}

inline Verdict Worst(Verdict a, Verdict b) {
    return Downgrade(a, b);
}

inline int ExitCode(Verdict verdict) {
    return static_cast<int>(verdict);
}

inline const char* VerdictName(Verdict verdict) {
    switch (verdict) {
        case Verdict::UNCHANGED:
            return "UNCHANGED";
        case Verdict::CHANGED:
            return "CHANGED";
        case Verdict::BROKEN:
            return "BROKEN";
    }
    return "UNKNOWN";
}

inline std::ostream& operator<<(std::ostream& os, Verdict verdict) {
    return os << VerdictName(verdict);
}

} // namespace BibSane

#endif // BIBSANE_SRC_COMMON_VERDICT_H_
