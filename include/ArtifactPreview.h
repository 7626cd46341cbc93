#pragma once
// ArtifactPreview.h — безопасный предпросмотр найденного файла
//
// Читается не больше PREVIEW_MAX_BYTES (2048) байт через mmap.
// Если среди них есть управляющие байты (кроме \t \n \r) — файл считается
// бинарным и содержимое заменяется маркером BINARY_REDACTION_MARKER.
// Текст приводится к валидному UTF-8 (битые последовательности -> U+FFFD).

#include <string>
#include "ScanTypes.h"

inline const std::string BINARY_REDACTION_MARKER = "[binary content redacted]";

bool looks_binary(const char* data, size_t size);

PreviewResult preview_artifact(const std::string& path);
