#include "transaction.h"

namespace comptaflow {

QString extractionMethodName(ExtractionMethod method) {
    switch (method) {
    case ExtractionMethod::NativeRegex: return "native-regex";
    case ExtractionMethod::OcrRegex: return "ocr-regex";
    case ExtractionMethod::Llm: return "llm";
    }
    return "unknown";
}

} // namespace comptaflow
