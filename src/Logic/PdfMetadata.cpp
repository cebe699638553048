#include "PdfMetadata.h"

#include <wx/log.h>
#include <wx/mstream.h>
#include <wx/string.h>
#include <wx/strconv.h>
#include <wx/zstream.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <system_error> // For std::error_code
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace
{
constexpr std::size_t HeaderSearchBytes = 1024;
constexpr std::size_t MaxInflatedBytes = 64 * 1024 * 1024;

// PDFDocEncoding code points for bytes 0x80-0xA0; the rest of the table matches Latin-1
constexpr wchar_t PdfDocHighTable[] = {
	0x2022, 0x2020, 0x2021, 0x2026, 0x2014, 0x2013, 0x0192, 0x2044,
	0x2039, 0x203A, 0x2212, 0x2030, 0x201E, 0x201C, 0x201D, 0x2018,
	0x2019, 0x201A, 0x2122, 0xFB01, 0xFB02, 0x0141, 0x0152, 0x0160,
	0x0178, 0x017D, 0x0131, 0x0142, 0x0153, 0x0161, 0x017E, 0xFFFD,
	0x20AC};

bool IsPdfWhitespace(char c)
{
	return c == ' ' || c == '\n' || c == '\r' || c == '\t' || c == '\f' || c == '\0';
}

bool IsPdfDelimiter(char c)
{
	return IsPdfWhitespace(c) || c == '/' || c == '(' || c == '<' || c == '>' || c == '[' || c == ']';
}

std::string ToUtf8(const wxString &s)
{
	const wxScopedCharBuffer buf = s.utf8_str();
	return std::string(buf.data(), buf.length());
}

// Parses "<num> <gen> R" right after 'pos'
bool ParseReference(const std::string &data, std::size_t pos, long &number, long &generation)
{
	static const std::regex refRegex(R"(^\s*(\d+)\s+(\d+)\s+R)");
	std::smatch match;
	const std::string window = data.substr(pos, 40);
	if (!std::regex_search(window, match, refRegex))
	{
		return false;
	}
	try
	{
		number = std::stol(match[1].str());
		generation = std::stol(match[2].str());
	}
	catch (const std::exception &)
	{
		return false;
	}
	return true;
}

// Offset just past the last "<num> <gen> obj" header in 'data', or npos
std::size_t FindObjectStart(const std::string &data, long number, long generation)
{
	const std::string needle = std::to_string(number) + " " + std::to_string(generation) + " obj";
	std::size_t pos = data.rfind(needle);
	while (pos != std::string::npos)
	{
		// Reject "112 0 obj" when looking for "12 0 obj"
		if (pos == 0 || !std::isdigit(static_cast<unsigned char>(data[pos - 1])))
		{
			return pos + needle.size();
		}
		if (pos == 0)
		{
			break;
		}
		pos = data.rfind(needle, pos - 1);
	}
	return std::string::npos;
}

// Returns the body of the last "<num> <gen> obj ... endobj" in 'data', or an empty string
std::string FindObjectBody(const std::string &data, long number, long generation)
{
	const std::size_t bodyStart = FindObjectStart(data, number, generation);
	if (bodyStart == std::string::npos)
	{
		return std::string();
	}
	std::size_t bodyEnd = data.find("endobj", bodyStart);
	if (bodyEnd == std::string::npos)
	{
		bodyEnd = data.size();
	}
	return data.substr(bodyStart, bodyEnd - bodyStart);
}

// Reads a direct integer value such as "/Length 120"; "/Length 12 0 R" does not match
bool ReadIntegerKey(const std::string &dictionary, const std::string &key, long &value)
{
	const std::regex keyRegex(key + R"(\s+(\d+)(?!\d)(?!\s+\d+\s+R))");
	std::smatch match;
	if (!std::regex_search(dictionary, match, keyRegex))
	{
		return false;
	}
	try
	{
		value = std::stol(match[1].str());
	}
	catch (const std::exception &)
	{
		return false;
	}
	return value >= 0;
}

// Decodes the stream of the object whose body starts at 'bodyStart'.
// Only unfiltered and single FlateDecode streams without a predictor are supported.
bool ReadStreamData(const std::string &data, std::size_t bodyStart, std::string &dictionary, std::string &out)
{
	const std::size_t keyword = data.find("stream", bodyStart);
	const std::size_t endObj = data.find("endobj", bodyStart);
	if (keyword == std::string::npos || (endObj != std::string::npos && endObj < keyword))
	{
		return false;
	}
	dictionary = data.substr(bodyStart, keyword - bodyStart);

	std::size_t start = keyword + 6;
	if (start < data.size() && data[start] == '\r')
	{
		++start;
	}
	if (start < data.size() && data[start] == '\n')
	{
		++start;
	}

	std::size_t end = std::string::npos;
	long length = 0;
	if (ReadIntegerKey(dictionary, "/Length", length) && static_cast<std::size_t>(length) <= data.size() - start)
	{
		end = start + static_cast<std::size_t>(length);
	}
	else
	{
		end = data.find("endstream", start);
		if (end == std::string::npos)
		{
			return false;
		}
		while (end > start && (data[end - 1] == '\n' || data[end - 1] == '\r'))
		{
			--end;
		}
	}
	const std::string raw = data.substr(start, end - start);

	if (dictionary.find("/Filter") == std::string::npos)
	{
		out = raw;
		return true;
	}
	static const std::regex flateOnly(R"(/Filter\s*(/FlateDecode|\[\s*/FlateDecode\s*\]))");
	if (!std::regex_search(dictionary, flateOnly) || dictionary.find("/Predictor") != std::string::npos)
	{
		return false;
	}
	return PdfTitleExtractor::InflateFlate(raw, out);
}

// Body of object 'number' stored in a compressed object stream (/Type /ObjStm).
// 'undecodable' is set when an object stream cannot be read.
std::string FindCompressedObject(const std::string &data, long number, bool &undecodable)
{
	std::size_t pos = data.rfind("/ObjStm");
	while (pos != std::string::npos)
	{
		const std::size_t objKeyword = data.rfind("obj", pos);
		std::string dictionary, decoded;
		long count = 0, first = 0;
		if (objKeyword == std::string::npos || !ReadStreamData(data, objKeyword + 3, dictionary, decoded) ||
			!ReadIntegerKey(dictionary, "/N", count) || !ReadIntegerKey(dictionary, "/First", first) ||
			static_cast<std::size_t>(first) > decoded.size())
		{
			undecodable = true;
		}
		else
		{
			// Header: 'count' pairs of "<object number> <offset relative to /First>"
			std::istringstream header(decoded.substr(0, static_cast<std::size_t>(first)));
			std::vector<std::pair<long, long>> entries;
			long objectNumber = 0, offset = 0;
			for (long i = 0; i < count && header >> objectNumber >> offset; ++i)
			{
				entries.emplace_back(objectNumber, offset);
			}
			for (std::size_t i = 0; i < entries.size(); ++i)
			{
				if (entries[i].first != number)
				{
					continue;
				}
				const std::size_t begin = static_cast<std::size_t>(first + entries[i].second);
				const std::size_t end = i + 1 < entries.size() ? static_cast<std::size_t>(first + entries[i + 1].second) : decoded.size();
				if (begin <= end && end <= decoded.size())
				{
					return decoded.substr(begin, end - begin);
				}
				undecodable = true;
			}
		}
		if (pos == 0)
		{
			break;
		}
		pos = data.rfind("/ObjStm", pos - 1);
	}
	return std::string();
}

// Looks in the file body first, then in object streams (which only hold generation 0 objects)
std::string ResolveObject(const std::string &data, long number, long generation, bool &undecodable)
{
	std::string body = FindObjectBody(data, number, generation);
	if (body.empty() && generation == 0)
	{
		body = FindCompressedObject(data, number, undecodable);
	}
	return body;
}

// Finds the value following a "/Title" key and decodes it to raw string bytes
std::optional<std::string> ReadTitleValue(const std::string &data, const std::string &dictionary, bool &undecodable)
{
	std::size_t key = dictionary.find("/Title");
	while (key != std::string::npos)
	{
		std::size_t pos = key + 6;
		if (pos < dictionary.size() && !IsPdfDelimiter(dictionary[pos]))
		{
			key = dictionary.find("/Title", pos); // Some other key, e.g. "/TitleFont"
			continue;
		}
		while (pos < dictionary.size() && IsPdfWhitespace(dictionary[pos]))
		{
			++pos;
		}
		if (pos >= dictionary.size())
		{
			return std::nullopt;
		}

		if (dictionary[pos] == '(')
		{
			return PdfTitleExtractor::DecodeLiteralString(dictionary, pos);
		}
		if (dictionary[pos] == '<' && (pos + 1 >= dictionary.size() || dictionary[pos + 1] != '<'))
		{
			return PdfTitleExtractor::DecodeHexString(dictionary, pos);
		}

		// Indirect string object
		long number = 0, generation = 0;
		if (std::isdigit(static_cast<unsigned char>(dictionary[pos])) && ParseReference(dictionary, pos, number, generation))
		{
			const std::string body = ResolveObject(data, number, generation, undecodable);
			std::size_t start = body.find_first_of("(<");
			if (start == std::string::npos)
			{
				return std::nullopt;
			}
			if (body[start] == '(')
			{
				return PdfTitleExtractor::DecodeLiteralString(body, start);
			}
			return PdfTitleExtractor::DecodeHexString(body, start);
		}
		return std::nullopt;
	}
	return std::nullopt;
}

std::string DecodeXmlEntities(const std::string &text)
{
	wxString out;
	const wxString in = wxString::FromUTF8(text.data(), text.size());
	for (size_t i = 0; i < in.length(); ++i)
	{
		if (in[i] != '&')
		{
			out += in[i];
			continue;
		}
		const size_t semi = in.find(';', i);
		if (semi == wxString::npos)
		{
			out += in[i];
			continue;
		}
		const wxString entity = in.Mid(i + 1, semi - i - 1);
		unsigned long code = 0;
		if (entity == "amp")
			out += '&';
		else if (entity == "lt")
			out += '<';
		else if (entity == "gt")
			out += '>';
		else if (entity == "quot")
			out += '"';
		else if (entity == "apos")
			out += '\'';
		else if (entity.StartsWith("#x") && entity.Mid(2).ToULong(&code, 16))
			out += wxUniChar(static_cast<wxUint32>(code));
		else if (entity.StartsWith("#") && entity.Mid(1).ToULong(&code, 10))
			out += wxUniChar(static_cast<wxUint32>(code));
		else
		{
			out += in[i]; // Unknown entity, keep the text as is
			continue;
		}
		i = semi;
	}
	return ToUtf8(out);
}
} // namespace

PdfTitleExtractor::PdfTitleExtractor(std::uintmax_t maxReadBytes)
	: m_maxReadBytes(maxReadBytes)
{
}

// Reads at most m_maxReadBytes of the file; the stream is closed when this returns
ExtractionResult PdfTitleExtractor::ExtractLabel(const fs::path &path)
{
	ExtractionResult result;
	std::error_code ec;

	const std::uintmax_t size = fs::file_size(path, ec);
	if (ec)
	{
		result.errorMessage = "Cannot determine file size: " + ec.message();
		return result;
	}

	std::ifstream in(path, std::ios::in | std::ios::binary);
	if (!in.is_open())
	{
		result.errorMessage = "Cannot open file for reading";
		return result;
	}

	std::string header(static_cast<std::size_t>(std::min<std::uintmax_t>(size, HeaderSearchBytes)), '\0');
	in.read(&header[0], static_cast<std::streamsize>(header.size()));
	if (in.gcount() != static_cast<std::streamsize>(header.size()) || header.find("%PDF-") == std::string::npos)
	{
		result.errorMessage = "Not a PDF file (missing %PDF- header)";
		return result;
	}

	// The trailer lives at the end of the file, so an oversized file is read from its tail
	const std::uintmax_t readBytes = std::min(size, m_maxReadBytes);
	std::string data(static_cast<std::size_t>(readBytes), '\0');
	in.seekg(static_cast<std::streamoff>(size - readBytes), std::ios::beg);
	in.read(&data[0], static_cast<std::streamsize>(readBytes));
	if (in.bad() || in.gcount() != static_cast<std::streamsize>(readBytes))
	{
		result.errorMessage = "Read error while loading PDF structure";
		return result;
	}

	std::string infoError;
	std::optional<std::string> title = FindInfoTitle(data, infoError);
	if (!title || title->empty())
	{
		title = FindXmpTitle(data);
	}
	if (!title || title->empty())
	{
		title = FindCompressedXmpTitle(data);
	}
	if (title && !title->empty())
	{
		result.label = title;
	}
	else if (!infoError.empty())
	{
		// A title may exist but could not be read; not the same as "no title"
		result.errorMessage = infoError;
		return result;
	}
	result.success = true;
	return result;
}

// Follows the last "/Info n g R" reference (classic trailer or cross-reference stream)
std::optional<std::string> PdfTitleExtractor::FindInfoTitle(const std::string &data, std::string &errorMessage)
{
	std::size_t pos = data.rfind("/Info");
	while (pos != std::string::npos)
	{
		long number = 0, generation = 0;
		if (ParseReference(data, pos + 5, number, generation))
		{
			bool undecodable = false;
			const std::string body = ResolveObject(data, number, generation, undecodable);
			if (body.empty())
			{
				if (undecodable)
				{
					errorMessage = "Info dictionary is in a compressed object stream that cannot be decoded";
				}
				return std::nullopt;
			}
			std::optional<std::string> raw = ReadTitleValue(data, body, undecodable);
			if (!raw)
			{
				if (undecodable)
				{
					errorMessage = "Title is in a compressed object stream that cannot be decoded";
				}
				return std::nullopt;
			}
			return TextStringToUtf8(*raw);
		}
		if (pos == 0)
		{
			break;
		}
		pos = data.rfind("/Info", pos - 1);
	}
	return std::nullopt;
}

// Reads the first rdf:li of the XMP packet's dc:title
std::optional<std::string> PdfTitleExtractor::FindXmpTitle(const std::string &data)
{
	const std::size_t titleStart = data.find("<dc:title");
	if (titleStart == std::string::npos)
	{
		return std::nullopt;
	}
	const std::size_t titleEnd = data.find("</dc:title>", titleStart);
	if (titleEnd == std::string::npos)
	{
		return std::nullopt;
	}

	const std::size_t li = data.find("<rdf:li", titleStart);
	if (li == std::string::npos || li > titleEnd)
	{
		return std::nullopt;
	}
	const std::size_t textStart = data.find('>', li);
	const std::size_t textEnd = data.find("</rdf:li>", li);
	if (textStart == std::string::npos || textEnd == std::string::npos || textStart > textEnd)
	{
		return std::nullopt;
	}

	std::string text = DecodeXmlEntities(data.substr(textStart + 1, textEnd - textStart - 1));
	if (text.empty())
	{
		return std::nullopt;
	}
	return text;
}

// Searches Metadata streams for a Flate compressed XMP packet
std::optional<std::string> PdfTitleExtractor::FindCompressedXmpTitle(const std::string &data)
{
	static const std::regex metadataType(R"(/Type\s*/Metadata\b)");
	std::size_t pos = data.rfind("/Metadata");
	while (pos != std::string::npos)
	{
		const std::size_t objKeyword = data.rfind("obj", pos);
		std::string dictionary, decoded;
		if (objKeyword != std::string::npos && ReadStreamData(data, objKeyword + 3, dictionary, decoded) &&
			std::regex_search(dictionary, metadataType))
		{
			std::optional<std::string> title = FindXmpTitle(decoded);
			if (title)
			{
				return title;
			}
		}
		if (pos == 0)
		{
			break;
		}
		pos = data.rfind("/Metadata", pos - 1);
	}
	return std::nullopt;
}

// Inflates zlib wrapped FlateDecode data
bool PdfTitleExtractor::InflateFlate(const std::string &compressed, std::string &out)
{
	wxLogNull noLog; // Corrupt data is reported through the return value
	wxMemoryInputStream source(compressed.data(), compressed.size());
	wxZlibInputStream inflater(source, wxZLIB_ZLIB);
	if (!inflater.IsOk())
	{
		return false;
	}

	out.clear();
	char buffer[16384];
	while (inflater.Read(buffer, sizeof(buffer)).LastRead() > 0)
	{
		out.append(buffer, inflater.LastRead());
		if (out.size() > MaxInflatedBytes)
		{
			return false;
		}
	}
	return inflater.GetLastError() == wxSTREAM_EOF || inflater.GetLastError() == wxSTREAM_NO_ERROR;
}

// Decodes a PDF literal string starting at the '(' at 'pos'; 'pos' ends past the closing ')'
std::string PdfTitleExtractor::DecodeLiteralString(const std::string &data, std::size_t &pos)
{
	std::string out;
	int depth = 0;
	for (; pos < data.size(); ++pos)
	{
		char c = data[pos];
		if (c == '\\')
		{
			if (++pos >= data.size())
			{
				break;
			}
			char e = data[pos];
			switch (e)
			{
			case 'n':
				out += '\n';
				break;
			case 'r':
				out += '\r';
				break;
			case 't':
				out += '\t';
				break;
			case 'b':
				out += '\b';
				break;
			case 'f':
				out += '\f';
				break;
			case '\r':
				// Line continuation; swallow an optional following LF
				if (pos + 1 < data.size() && data[pos + 1] == '\n')
				{
					++pos;
				}
				break;
			case '\n':
				break;
			default:
				if (e >= '0' && e <= '7')
				{
					int value = e - '0';
					for (int digits = 1; digits < 3 && pos + 1 < data.size() && data[pos + 1] >= '0' && data[pos + 1] <= '7'; ++digits)
					{
						value = value * 8 + (data[++pos] - '0');
					}
					out += static_cast<char>(value & 0xFF);
				}
				else
				{
					out += e; // "\(", "\)", "\\" and unknown escapes
				}
				break;
			}
			continue;
		}
		if (c == '(')
		{
			if (depth++ > 0)
			{
				out += c;
			}
			continue;
		}
		if (c == ')')
		{
			if (--depth == 0)
			{
				++pos;
				break;
			}
			out += c;
			continue;
		}
		out += c;
	}
	return out;
}

// Decodes a PDF hex string starting at the '<' at 'pos'; 'pos' ends past the closing '>'
std::string PdfTitleExtractor::DecodeHexString(const std::string &data, std::size_t &pos)
{
	std::string digits;
	for (++pos; pos < data.size() && data[pos] != '>'; ++pos)
	{
		if (std::isxdigit(static_cast<unsigned char>(data[pos])))
		{
			digits += data[pos];
		}
	}
	if (pos < data.size())
	{
		++pos;
	}
	if (digits.size() % 2 != 0)
	{
		digits += '0';
	}

	std::string out;
	out.reserve(digits.size() / 2);
	for (std::size_t i = 0; i < digits.size(); i += 2)
	{
		out += static_cast<char>(std::stoi(digits.substr(i, 2), nullptr, 16));
	}
	return out;
}

// PDF text strings are UTF-16BE with a BOM, UTF-8 with a BOM (PDF 2.0) or PDFDocEncoding
std::string PdfTitleExtractor::TextStringToUtf8(const std::string &raw)
{
	if (raw.size() >= 2 && static_cast<unsigned char>(raw[0]) == 0xFE && static_cast<unsigned char>(raw[1]) == 0xFF)
	{
		const wxString text(raw.data() + 2, wxMBConvUTF16BE(), raw.size() - 2);
		return ToUtf8(text);
	}
	if (raw.size() >= 3 && raw.compare(0, 3, "\xEF\xBB\xBF") == 0)
	{
		return raw.substr(3);
	}

	wxString text;
	for (unsigned char c : raw)
	{
		if (c >= 0x80 && c <= 0xA0)
		{
			text += wxUniChar(static_cast<wxUint32>(PdfDocHighTable[c - 0x80]));
		}
		else
		{
			text += wxUniChar(static_cast<wxUint32>(c));
		}
	}
	return ToUtf8(text);
}
