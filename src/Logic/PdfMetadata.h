#ifndef PDFMETADATA_H
#define PDFMETADATA_H

#include <string>
#include <optional>
#include <filesystem>
#include <cstdint>

namespace fs = std::filesystem;

// Result of reading a label from a file's embedded metadata
struct ExtractionResult
{
	std::optional<std::string> label; // Absent when the file carries no usable title
	std::string errorMessage;
	bool success = false;
};

// Source of the raw label used as the new file name
class LabelExtractor
{
public:
	virtual ~LabelExtractor() = default;
	virtual ExtractionResult ExtractLabel(const fs::path &path) = 0;
};

// Reads the document title from a PDF's Info dictionary, falling back to the XMP dc:title
class PdfTitleExtractor : public LabelExtractor
{
public:
	explicit PdfTitleExtractor(std::uintmax_t maxReadBytes = 64ull * 1024 * 1024);

	ExtractionResult ExtractLabel(const fs::path &path) override;

	// 'errorMessage' is set when an Info dictionary exists but cannot be decoded
	static std::optional<std::string> FindInfoTitle(const std::string &data, std::string &errorMessage);
	static std::optional<std::string> FindXmpTitle(const std::string &data);
	static std::optional<std::string> FindCompressedXmpTitle(const std::string &data);
	static bool InflateFlate(const std::string &compressed, std::string &out);
	static std::string DecodeLiteralString(const std::string &data, std::size_t &pos);
	static std::string DecodeHexString(const std::string &data, std::size_t &pos);
	static std::string TextStringToUtf8(const std::string &raw);

private:
	std::uintmax_t m_maxReadBytes;
};

#endif // PDFMETADATA_H
