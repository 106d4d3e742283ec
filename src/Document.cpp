#include "Document.hpp"

#include "Errors.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace redact {

namespace {

// Readers accept a header anywhere in the first kilobyte
bool looksLikePdf(const std::string &bytes) {
  return bytes.find("%PDF-") < 1024;
}

} // anonymous namespace

Document::Document()
    : m_bytes(std::make_shared<const std::string>()), m_password() {}

Document::Document(std::shared_ptr<const std::string> bytes,
                   std::string password)
    : m_bytes(std::move(bytes)), m_password(std::move(password)) {}

Document Document::fromFile(const std::string &path,
                            const std::string &password) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw InputError("Cannot open input file: " + path);
  }
  std::string bytes((std::istreambuf_iterator<char>(in)),
                    std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw InputError("Failed to read input file: " + path);
  }
  if (!looksLikePdf(bytes)) {
    throw InputError("Not a PDF file: " + path);
  }
  return Document(std::make_shared<const std::string>(std::move(bytes)),
                  password);
}

Document Document::fromBytes(std::string bytes, const std::string &password) {
  if (!looksLikePdf(bytes)) {
    throw InputError("Buffer does not contain a PDF document");
  }
  return Document(std::make_shared<const std::string>(std::move(bytes)),
                  password);
}

void Document::save(const std::string &path) const {
  std::string tempPath = path + ".partial";
  {
    std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw InputError("Cannot create output file: " + tempPath);
    }
    out.write(m_bytes->data(), static_cast<std::streamsize>(m_bytes->size()));
    out.flush();
    if (!out) {
      out.close();
      std::remove(tempPath.c_str());
      throw InputError("Failed to write output file: " + tempPath);
    }
  }

  std::error_code ec;
  std::filesystem::rename(tempPath, path, ec);
  if (ec) {
    std::remove(tempPath.c_str());
    throw InputError("Cannot move output into place: " + path + ": " +
                     ec.message());
  }
}

} // namespace redact
