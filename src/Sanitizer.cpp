#include "Sanitizer.hpp"

#include "Log.hpp"
#include "QpdfSupport.hpp"

#include <qpdf/QPDFAcroFormDocumentHelper.hh>
#include <qpdf/QPDFAnnotationObjectHelper.hh>
#include <qpdf/QPDFFormFieldObjectHelper.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <functional>

namespace redact {

namespace {

const std::set<std::string> kExternalActions = {
    "/URI",        "/Launch",     "/GoToR",     "/GoToE",
    "/SubmitForm", "/ImportData", "/JavaScript"};

std::string nameOf(QPDFObjectHandle object) {
  return object.isName() ? object.getName() : std::string();
}

std::string actionType(QPDFObjectHandle action) {
  return action.isDictionary() ? nameOf(action.getKey("/S")) : std::string();
}

QPDFObjectHandle dictionaryOf(QPDFObjectHandle object) {
  if (object.isStream()) {
    return object.getDict();
  }
  return object.isDictionary() ? object : QPDFObjectHandle::newNull();
}

int countNameTreeLeaves(QPDFObjectHandle node, int depth) {
  if (!node.isDictionary() || depth > 32) {
    return 0;
  }
  int count = 0;
  QPDFObjectHandle names = node.getKey("/Names");
  if (names.isArray()) {
    count += names.getArrayNItems() / 2;
  }
  QPDFObjectHandle kids = node.getKey("/Kids");
  if (kids.isArray()) {
    for (int i = 0; i < kids.getArrayNItems(); ++i) {
      count += countNameTreeLeaves(kids.getArrayItem(i), depth + 1);
    }
  }
  return count;
}

// Walks every channel once. With `remove` unset it only counts, which is
// how analyze() shares the detection logic with sanitize().
class ChannelScrubber {
public:
  ChannelScrubber(QPDF &pdf, bool remove, SanitizationReport &report)
      : m_pdf(pdf), m_remove(remove), m_report(report),
        m_pages(QPDFPageDocumentHelper(pdf).getAllPages()) {}

  void metadata() {
    QPDFObjectHandle trailer = m_pdf.getTrailer();
    QPDFObjectHandle info = trailer.getKey("/Info");
    if (info.isDictionary()) {
      for (const auto &key : info.getKeys()) {
        m_report.metadataRemoved.insert(key.substr(1));
      }
    }
    if (m_remove && trailer.hasKey("/Info")) {
      trailer.removeKey("/Info");
    }

    for (auto &object : m_pdf.getAllObjects()) {
      QPDFObjectHandle dict = dictionaryOf(object);
      if (!dict.isDictionary() || !dict.hasKey("/Metadata")) {
        continue;
      }
      m_report.metadataRemoved.insert("XMP");
      if (m_remove) {
        dict.removeKey("/Metadata");
      }
    }
  }

  void identifier() {
    if (m_remove) {
      m_pdf.getTrailer().removeKey("/ID");
    }
  }

  void javascript() {
    QPDFObjectHandle root = m_pdf.getRoot();
    for (const char *key : {"/OpenAction", "/AA"}) {
      if (root.hasKey(key)) {
        ++m_report.javascriptRemoved;
        removeKey(root, key);
      }
    }

    QPDFObjectHandle names = root.getKey("/Names");
    if (names.isDictionary() && names.hasKey("/JavaScript")) {
      m_report.javascriptRemoved +=
          countNameTreeLeaves(names.getKey("/JavaScript"), 0);
      removeKey(names, "/JavaScript");
    }

    for (auto &object : m_pdf.getAllObjects()) {
      scrubActions(dictionaryOf(object));
    }
    // Annotations written inline in /Annots are not in the object table
    for (auto &page : m_pages) {
      for (auto &annotation : page.getAnnotations()) {
        QPDFObjectHandle annot = annotation.getObjectHandle();
        if (!annot.isIndirect()) {
          scrubActions(annot);
        }
      }
    }
  }

  void embeddedFiles() {
    QPDFObjectHandle root = m_pdf.getRoot();
    QPDFObjectHandle names = root.getKey("/Names");
    if (names.isDictionary() && names.hasKey("/EmbeddedFiles")) {
      m_report.embeddedFilesRemoved +=
          countNameTreeLeaves(names.getKey("/EmbeddedFiles"), 0);
      removeKey(names, "/EmbeddedFiles");
    }
    if (m_remove && names.isDictionary() && names.getKeys().empty()) {
      root.removeKey("/Names");
    }

    for (const char *key : {"/AF", "/Collection"}) {
      if (root.hasKey(key)) {
        ++m_report.embeddedFilesRemoved;
        removeKey(root, key);
      }
    }

    m_report.embeddedFilesRemoved +=
        filterAnnotations([](QPDFAnnotationObjectHelper &annotation) {
          return annotation.getSubtype() == "/FileAttachment";
        });
  }

  void links() {
    m_report.linksRemoved +=
        filterAnnotations([](QPDFAnnotationObjectHelper &annotation) {
          if (annotation.getSubtype() != "/Link") {
            return false;
          }
          std::string type =
              actionType(annotation.getObjectHandle().getKey("/A"));
          return kExternalActions.count(type) > 0;
        });
  }

  void forms() {
    QPDFObjectHandle root = m_pdf.getRoot();
    if (!root.hasKey("/AcroForm")) {
      return;
    }
    QPDFAcroFormDocumentHelper forms(m_pdf);
    m_report.formsFlattened += static_cast<int>(forms.getFormFields().size());
    if (!m_remove) {
      return;
    }

    try {
      forms.generateAppearancesIfNeeded();
    } catch (const std::exception &e) {
      debugLog() << "DEBUG: Could not generate form appearances: " << e.what()
                << std::endl;
    }
    for (auto &page : m_pages) {
      flattenWidgets(forms, page);
    }
    root.removeKey("/AcroForm");
  }

  void thumbnails() {
    for (auto &page : m_pages) {
      QPDFObjectHandle pageObject = page.getObjectHandle();
      for (const char *key : {"/Thumb", "/PieceInfo"}) {
        if (pageObject.hasKey(key)) {
          ++m_report.thumbnailsRemoved;
          removeKey(pageObject, key);
        }
      }
    }
    QPDFObjectHandle root = m_pdf.getRoot();
    if (root.hasKey("/PieceInfo")) {
      ++m_report.thumbnailsRemoved;
      removeKey(root, "/PieceInfo");
    }
  }

  // Attachments, external links and form widgets belong to their own
  // channels; when nothing is removed they are still present here
  void annotations() {
    bool hasForm = m_pdf.getRoot().hasKey("/AcroForm");
    m_report.annotationsRemoved +=
        filterAnnotations([hasForm](QPDFAnnotationObjectHelper &annotation) {
          std::string subtype = annotation.getSubtype();
          if (subtype == "/FileAttachment" ||
              (subtype == "/Widget" && hasForm)) {
            return false;
          }
          if (subtype == "/Link") {
            std::string type =
                actionType(annotation.getObjectHandle().getKey("/A"));
            return kExternalActions.count(type) == 0;
          }
          return true;
        });
  }

private:
  void removeKey(QPDFObjectHandle dict, const std::string &key) {
    if (m_remove) {
      dict.removeKey(key);
    }
  }

  void scrubActions(QPDFObjectHandle dict) {
    if (!dict.isDictionary()) {
      return;
    }
    if (dict.hasKey("/AA")) {
      ++m_report.javascriptRemoved;
      removeKey(dict, "/AA");
    }
    if (actionType(dict.getKey("/A")) == "/JavaScript") {
      ++m_report.javascriptRemoved;
      removeKey(dict, "/A");
    }
  }

  // Drop the annotations matching `shouldRemove` from every page
  int filterAnnotations(
      const std::function<bool(QPDFAnnotationObjectHelper &)> &shouldRemove) {
    int removed = 0;
    for (auto &page : m_pages) {
      std::vector<QPDFAnnotationObjectHelper> annotations =
          page.getAnnotations();
      std::vector<QPDFObjectHandle> kept;
      for (auto &annotation : annotations) {
        if (shouldRemove(annotation)) {
          ++removed;
        } else {
          kept.push_back(annotation.getObjectHandle());
        }
      }
      if (m_remove && kept.size() != annotations.size()) {
        replaceAnnotations(page, kept);
      }
    }
    return removed;
  }

  void replaceAnnotations(QPDFPageObjectHelper &page,
                          const std::vector<QPDFObjectHandle> &annotations) {
    QPDFObjectHandle pageObject = page.getObjectHandle();
    if (annotations.empty()) {
      pageObject.removeKey("/Annots");
    } else {
      pageObject.replaceKey("/Annots",
                            QPDFObjectHandle::newArray(annotations));
    }
  }

  // Paint widget appearances into the page and drop the widgets
  void flattenWidgets(QPDFAcroFormDocumentHelper &forms,
                      QPDFPageObjectHelper &page) {
    std::vector<QPDFAnnotationObjectHelper> annotations =
        page.getAnnotations();
    bool hasWidget = false;
    for (auto &annotation : annotations) {
      hasWidget = hasWidget || annotation.getSubtype() == "/Widget";
    }
    if (!hasWidget) {
      return;
    }

    int rotate = 0;
    QPDFObjectHandle rotateObject = page.getAttribute("/Rotate", false);
    if (rotateObject.isInteger()) {
      rotate = rotateObject.getIntValueAsInt();
    }
    QPDFObjectHandle resources = page.getAttribute("/Resources", true);
    if (!resources.isDictionary()) {
      resources = QPDFObjectHandle::newDictionary();
      page.getObjectHandle().replaceKey("/Resources", resources);
    }

    std::vector<QPDFObjectHandle> kept;
    std::string content;
    int nextName = 1;
    for (auto &annotation : annotations) {
      if (annotation.getSubtype() != "/Widget") {
        kept.push_back(annotation.getObjectHandle());
        continue;
      }
      QPDFObjectHandle appearance = annotation.getAppearanceStream("/N");
      if (!appearance.isStream()) {
        continue;
      }
      QPDFObjectHandle appearanceDict = appearance.getDict();
      appearanceDict.replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
      appearanceDict.replaceKey("/Subtype", QPDFObjectHandle::newName("/Form"));

      QPDFFormFieldObjectHelper field = forms.getFieldForAnnotation(annotation);
      QPDFObjectHandle appearanceResources = appearanceDict.getKey("/Resources");
      if (appearanceResources.isIndirect()) {
        appearanceDict.replaceKey("/Resources",
                                  appearanceResources.shallowCopy());
        appearanceResources = appearanceDict.getKey("/Resources");
      }
      if (appearanceResources.isDictionary()) {
        appearanceResources.mergeResources(field.getDefaultResources());
      }

      std::string name = resources.getUniqueResourceName("/Fxo", nextName);
      std::string placement =
          annotation.getPageContentForAppearance(name, rotate);
      if (!placement.empty()) {
        resources.mergeResources(
            QPDFObjectHandle::parse("<< /XObject << >> >>"));
        resources.getKey("/XObject").replaceKey(name, appearance);
        ++nextName;
      }
      content += placement;
    }

    replaceAnnotations(page, kept);
    if (!content.empty()) {
      page.addPageContents(QPDFObjectHandle::newStream(&m_pdf, "q\n"), true);
      page.addPageContents(
          QPDFObjectHandle::newStream(&m_pdf, "\nQ\n" + content), false);
    }
  }

  QPDF &m_pdf;
  bool m_remove;
  SanitizationReport &m_report;
  std::vector<QPDFPageObjectHelper> m_pages;
};

} // anonymous namespace

bool SanitizationReport::isEmpty() const {
  return metadataRemoved.empty() && javascriptRemoved == 0 &&
         embeddedFilesRemoved == 0 && linksRemoved == 0 &&
         formsFlattened == 0 && thumbnailsRemoved == 0 &&
         annotationsRemoved == 0;
}

Sanitizer::Sanitizer(const SanitizeConfig &config) : m_config(config) {}

SanitizeResult Sanitizer::sanitize(const Document &document) const {
  QPDF pdf;
  loadDocument(pdf, document);

  SanitizeResult result;
  ChannelScrubber scrubber(pdf, true, result.report);
  scrubber.metadata();
  scrubber.identifier();
  if (!m_config.metadataOnly) {
    scrubber.javascript();
    scrubber.embeddedFiles();
    scrubber.links();
    scrubber.forms();
    scrubber.thumbnails();
    if (!m_config.keepAnnotations) {
      scrubber.annotations();
    }
  }

  result.document = writeDocument(pdf, true);
  return result;
}

SecurityAnalysis Sanitizer::analyze(const Document &document) const {
  QPDF pdf;
  loadDocument(pdf, document);

  SanitizationReport found;
  ChannelScrubber scrubber(pdf, false, found);
  scrubber.metadata();
  scrubber.javascript();
  scrubber.embeddedFiles();
  scrubber.links();
  scrubber.forms();
  scrubber.thumbnails();
  scrubber.annotations();

  SecurityAnalysis analysis;
  analysis.pageCount =
      static_cast<int>(QPDFPageDocumentHelper(pdf).getAllPages().size());
  analysis.encrypted = pdf.isEncrypted();
  analysis.metadataFound.assign(found.metadataRemoved.begin(),
                                found.metadataRemoved.end());
  analysis.javascriptCount = found.javascriptRemoved;
  analysis.embeddedFilesCount = found.embeddedFilesRemoved;
  analysis.linksCount = found.linksRemoved;
  analysis.formFieldCount = found.formsFlattened;
  analysis.annotationsCount = found.annotationsRemoved;
  analysis.thumbnailsCount = found.thumbnailsRemoved;

  if (!analysis.metadataFound.empty()) {
    analysis.warnings.push_back(
        "Document contains metadata that may reveal sensitive information");
  }
  if (analysis.javascriptCount > 0) {
    analysis.warnings.push_back(
        "Document contains JavaScript which could be a security risk");
  }
  if (analysis.embeddedFilesCount > 0) {
    analysis.warnings.push_back("Document contains " +
                                std::to_string(analysis.embeddedFilesCount) +
                                " embedded files");
  }
  if (analysis.linksCount > 0) {
    analysis.warnings.push_back("Document contains " +
                                std::to_string(analysis.linksCount) +
                                " external links");
  }
  if (analysis.formFieldCount > 0) {
    analysis.warnings.push_back("Document contains " +
                                std::to_string(analysis.formFieldCount) +
                                " form fields");
  }
  return analysis;
}

} // namespace redact
