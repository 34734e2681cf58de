#include "inspectresult.hpp"

std::string formatName(ContainerFormat format) {
    switch (format) {
        case ContainerFormat::Zip: return "ZIP";
        case ContainerFormat::Ole: return "OLE";
        case ContainerFormat::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::string errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::UnsupportedFormat: return "UnsupportedFormat";
        case ErrorKind::CorruptContainer: return "CorruptContainer";
        case ErrorKind::EntryIOError: return "EntryIOError";
    }
    return "";
}

int exitCode(const InspectReport& report) {
    if (!report.error)
        return 0;
    switch (*report.error) {
        case ErrorKind::NotFound: return 2;
        case ErrorKind::UnsupportedFormat: return 3;
        case ErrorKind::CorruptContainer: return 4;
        // entry failures are recorded per result and never fail the run
        case ErrorKind::EntryIOError: return 0;
    }
    return 1;
}
