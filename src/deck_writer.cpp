#include "deck_writer.hpp"
#include "errors.hpp"
#include "process.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace vid2slides {

namespace {

constexpr const char* kXmlHeader =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n";

constexpr const char* kNamespaces =
    "xmlns:a=\"http://schemas.openxmlformats.org/drawingml/2006/main\" "
    "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\" "
    "xmlns:p=\"http://schemas.openxmlformats.org/presentationml/2006/main\"";

constexpr const char* kRelsNamespace =
    "http://schemas.openxmlformats.org/package/2006/relationships";
constexpr const char* kRelType =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships/";

constexpr const char* kEmptyGroup =
    "<p:nvGrpSpPr><p:cNvPr id=\"1\" name=\"\"/><p:cNvGrpSpPr/><p:nvPr/></p:nvGrpSpPr>"
    "<p:grpSpPr><a:xfrm><a:off x=\"0\" y=\"0\"/><a:ext cx=\"0\" cy=\"0\"/>"
    "<a:chOff x=\"0\" y=\"0\"/><a:chExt cx=\"0\" cy=\"0\"/></a:xfrm></p:grpSpPr>";

std::string xml_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        case '\'': out += "&apos;"; break;
        default: out += c; break;
        }
    }
    return out;
}

void write_part(const fs::path& path, const std::string& content) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw ArtifactError("cannot create " + path.parent_path().string() + ": " + ec.message());
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw ArtifactError("cannot open " + path.string() + " for writing");
    }
    file << content;
    if (!file) {
        throw ArtifactError("failed to write " + path.string());
    }
}

std::string relationship(const std::string& id, const std::string& type, const std::string& target) {
    return "<Relationship Id=\"" + id + "\" Type=\"" + kRelType + type + "\" Target=\"" +
           target + "\"/>";
}

std::string relationships(const std::string& body) {
    return std::string(kXmlHeader) + "<Relationships xmlns=\"" + kRelsNamespace + "\">" + body +
           "</Relationships>";
}

std::string content_types(std::size_t slide_count) {
    std::ostringstream xml;
    xml << kXmlHeader
        << "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
        << "<Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>"
        << "<Default Extension=\"xml\" ContentType=\"application/xml\"/>"
        << "<Default Extension=\"png\" ContentType=\"image/png\"/>"
        << "<Override PartName=\"/ppt/presentation.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.presentationml.presentation.main+xml\"/>"
        << "<Override PartName=\"/ppt/slideMasters/slideMaster1.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.presentationml.slideMaster+xml\"/>"
        << "<Override PartName=\"/ppt/slideLayouts/slideLayout1.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.presentationml.slideLayout+xml\"/>"
        << "<Override PartName=\"/ppt/theme/theme1.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.theme+xml\"/>";
    for (std::size_t i = 1; i <= slide_count; ++i) {
        xml << "<Override PartName=\"/ppt/slides/slide" << i
            << ".xml\" ContentType=\"application/vnd.openxmlformats-officedocument.presentationml.slide+xml\"/>";
    }
    xml << "<Override PartName=\"/docProps/core.xml\" ContentType=\"application/vnd.openxmlformats-package.core-properties+xml\"/>"
        << "<Override PartName=\"/docProps/app.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.extended-properties+xml\"/>"
        << "</Types>";
    return xml.str();
}

std::string root_relationships() {
    return relationships(
        relationship("rId1", "officeDocument", "ppt/presentation.xml") +
        "<Relationship Id=\"rId2\" Type=\"http://schemas.openxmlformats.org/package/2006/relationships/metadata/core-properties\" Target=\"docProps/core.xml\"/>" +
        relationship("rId3", "extended-properties", "docProps/app.xml"));
}

std::string core_properties(const std::string& title) {
    return std::string(kXmlHeader) +
           "<cp:coreProperties "
           "xmlns:cp=\"http://schemas.openxmlformats.org/package/2006/metadata/core-properties\" "
           "xmlns:dc=\"http://purl.org/dc/elements/1.1/\">"
           "<dc:title>" + xml_escape(title) + "</dc:title>"
           "<dc:creator>vid2slides</dc:creator>"
           "</cp:coreProperties>";
}

std::string app_properties(std::size_t slide_count) {
    return std::string(kXmlHeader) +
           "<Properties xmlns=\"http://schemas.openxmlformats.org/officeDocument/2006/extended-properties\">"
           "<Application>vid2slides</Application>"
           "<Slides>" + std::to_string(slide_count) + "</Slides>"
           "</Properties>";
}

// Slide relationship ids start after the master (rId1) and theme (rId2)
std::string presentation(std::size_t slide_count) {
    std::ostringstream xml;
    xml << kXmlHeader << "<p:presentation " << kNamespaces << " saveSubsetFonts=\"1\">"
        << "<p:sldMasterIdLst><p:sldMasterId id=\"2147483648\" r:id=\"rId1\"/></p:sldMasterIdLst>"
        << "<p:sldIdLst>";
    for (std::size_t i = 0; i < slide_count; ++i) {
        xml << "<p:sldId id=\"" << 256 + i << "\" r:id=\"rId" << i + 3 << "\"/>";
    }
    xml << "</p:sldIdLst>"
        << "<p:sldSz cx=\"" << PptxDeckWriter::kSlideWidthEmu << "\" cy=\""
        << PptxDeckWriter::kSlideHeightEmu << "\"/>"
        << "<p:notesSz cx=\"6858000\" cy=\"9144000\"/>"
        << "</p:presentation>";
    return xml.str();
}

std::string presentation_relationships(std::size_t slide_count) {
    std::string body = relationship("rId1", "slideMaster", "slideMasters/slideMaster1.xml") +
                       relationship("rId2", "theme", "theme/theme1.xml");
    for (std::size_t i = 0; i < slide_count; ++i) {
        body += relationship("rId" + std::to_string(i + 3), "slide",
                             "slides/slide" + std::to_string(i + 1) + ".xml");
    }
    return relationships(body);
}

std::string slide_master() {
    return std::string(kXmlHeader) + "<p:sldMaster " + kNamespaces + ">" +
           "<p:cSld><p:bg><p:bgRef idx=\"1001\"><a:schemeClr val=\"bg1\"/></p:bgRef></p:bg>"
           "<p:spTree>" + kEmptyGroup + "</p:spTree></p:cSld>"
           "<p:clrMap bg1=\"lt1\" tx1=\"dk1\" bg2=\"lt2\" tx2=\"dk2\" accent1=\"accent1\" "
           "accent2=\"accent2\" accent3=\"accent3\" accent4=\"accent4\" accent5=\"accent5\" "
           "accent6=\"accent6\" hlink=\"hlink\" folHlink=\"folHlink\"/>"
           "<p:sldLayoutIdLst><p:sldLayoutId id=\"2147483649\" r:id=\"rId1\"/></p:sldLayoutIdLst>"
           "</p:sldMaster>";
}

std::string slide_master_relationships() {
    return relationships(relationship("rId1", "slideLayout", "../slideLayouts/slideLayout1.xml") +
                         relationship("rId2", "theme", "../theme/theme1.xml"));
}

std::string blank_layout() {
    return std::string(kXmlHeader) + "<p:sldLayout " + kNamespaces +
           " type=\"blank\" preserve=\"1\">"
           "<p:cSld name=\"Blank\"><p:spTree>" + kEmptyGroup + "</p:spTree></p:cSld>"
           "<p:clrMapOvr><a:masterClrMapping/></p:clrMapOvr>"
           "</p:sldLayout>";
}

std::string blank_layout_relationships() {
    return relationships(relationship("rId1", "slideMaster", "../slideMasters/slideMaster1.xml"));
}

std::string solid_fill(const std::string& scheme_color) {
    return "<a:solidFill><a:schemeClr val=\"" + scheme_color + "\"/></a:solidFill>";
}

std::string theme() {
    std::string lines;
    for (const char* width : {"9525", "25400", "38100"}) {
        lines += std::string("<a:ln w=\"") + width + "\">" + solid_fill("phClr") + "</a:ln>";
    }
    std::string fills = solid_fill("phClr") + solid_fill("phClr") + solid_fill("phClr");

    return std::string(kXmlHeader) +
           "<a:theme xmlns:a=\"http://schemas.openxmlformats.org/drawingml/2006/main\" name=\"Office Theme\">"
           "<a:themeElements>"
           "<a:clrScheme name=\"Office\">"
           "<a:dk1><a:sysClr val=\"windowText\" lastClr=\"000000\"/></a:dk1>"
           "<a:lt1><a:sysClr val=\"window\" lastClr=\"FFFFFF\"/></a:lt1>"
           "<a:dk2><a:srgbClr val=\"1F497D\"/></a:dk2>"
           "<a:lt2><a:srgbClr val=\"EEECE1\"/></a:lt2>"
           "<a:accent1><a:srgbClr val=\"4F81BD\"/></a:accent1>"
           "<a:accent2><a:srgbClr val=\"C0504D\"/></a:accent2>"
           "<a:accent3><a:srgbClr val=\"9BBB59\"/></a:accent3>"
           "<a:accent4><a:srgbClr val=\"8064A2\"/></a:accent4>"
           "<a:accent5><a:srgbClr val=\"4BACC6\"/></a:accent5>"
           "<a:accent6><a:srgbClr val=\"F79646\"/></a:accent6>"
           "<a:hlink><a:srgbClr val=\"0000FF\"/></a:hlink>"
           "<a:folHlink><a:srgbClr val=\"800080\"/></a:folHlink>"
           "</a:clrScheme>"
           "<a:fontScheme name=\"Office\">"
           "<a:majorFont><a:latin typeface=\"Calibri\"/><a:ea typeface=\"\"/><a:cs typeface=\"\"/></a:majorFont>"
           "<a:minorFont><a:latin typeface=\"Calibri\"/><a:ea typeface=\"\"/><a:cs typeface=\"\"/></a:minorFont>"
           "</a:fontScheme>"
           "<a:fmtScheme name=\"Office\">"
           "<a:fillStyleLst>" + fills + "</a:fillStyleLst>"
           "<a:lnStyleLst>" + lines + "</a:lnStyleLst>"
           "<a:effectStyleLst>"
           "<a:effectStyle><a:effectLst/></a:effectStyle>"
           "<a:effectStyle><a:effectLst/></a:effectStyle>"
           "<a:effectStyle><a:effectLst/></a:effectStyle>"
           "</a:effectStyleLst>"
           "<a:bgFillStyleLst>" + fills + "</a:bgFillStyleLst>"
           "</a:fmtScheme>"
           "</a:themeElements>"
           "</a:theme>";
}

// One picture covering the whole canvas, no letterboxing
std::string picture_slide(const std::string& description) {
    std::ostringstream xml;
    xml << kXmlHeader << "<p:sld " << kNamespaces << ">"
        << "<p:cSld><p:spTree>" << kEmptyGroup
        << "<p:pic><p:nvPicPr><p:cNvPr id=\"2\" name=\"Picture 1\" descr=\""
        << xml_escape(description) << "\"/>"
        << "<p:cNvPicPr><a:picLocks noChangeAspect=\"1\"/></p:cNvPicPr><p:nvPr/></p:nvPicPr>"
        << "<p:blipFill><a:blip r:embed=\"rId2\"/><a:stretch><a:fillRect/></a:stretch></p:blipFill>"
        << "<p:spPr><a:xfrm><a:off x=\"0\" y=\"0\"/><a:ext cx=\"" << PptxDeckWriter::kSlideWidthEmu
        << "\" cy=\"" << PptxDeckWriter::kSlideHeightEmu << "\"/></a:xfrm>"
        << "<a:prstGeom prst=\"rect\"><a:avLst/></a:prstGeom></p:spPr>"
        << "</p:pic>"
        << "</p:spTree></p:cSld>"
        << "<p:clrMapOvr><a:masterClrMapping/></p:clrMapOvr>"
        << "</p:sld>";
    return xml.str();
}

std::string picture_slide_relationships(std::size_t number) {
    return relationships(
        relationship("rId1", "slideLayout", "../slideLayouts/slideLayout1.xml") +
        relationship("rId2", "image", "../media/image" + std::to_string(number) + ".png"));
}

fs::path make_staging_dir() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    auto stamp = std::chrono::high_resolution_clock::now().time_since_epoch().count();

    std::ostringstream name;
    name << "vid2slides-deck-" << stamp << "-" << std::hex << gen();
    fs::path dir = fs::temp_directory_path() / name.str();

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw ArtifactError("cannot create staging directory " + dir.string() + ": " + ec.message());
    }
    return dir;
}

// Removes a directory tree when it goes out of scope
class ScopedDirectory {
public:
    explicit ScopedDirectory(fs::path path) : path_(std::move(path)) {}
    ~ScopedDirectory() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            std::cerr << "Warning: could not remove " << path_ << ": " << ec.message() << std::endl;
        }
    }

    ScopedDirectory(const ScopedDirectory&) = delete;
    ScopedDirectory& operator=(const ScopedDirectory&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

} // namespace

PptxDeckWriter::PptxDeckWriter(std::string zip_executable)
    : zip_executable_(std::move(zip_executable)) {}

void PptxDeckWriter::stage(const std::vector<fs::path>& images, const fs::path& dir,
                           const std::string& title) const {
    const std::size_t count = images.size();

    write_part(dir / "[Content_Types].xml", content_types(count));
    write_part(dir / "_rels" / ".rels", root_relationships());
    write_part(dir / "docProps" / "core.xml", core_properties(title));
    write_part(dir / "docProps" / "app.xml", app_properties(count));

    fs::path ppt = dir / "ppt";
    write_part(ppt / "presentation.xml", presentation(count));
    write_part(ppt / "_rels" / "presentation.xml.rels", presentation_relationships(count));
    write_part(ppt / "slideMasters" / "slideMaster1.xml", slide_master());
    write_part(ppt / "slideMasters" / "_rels" / "slideMaster1.xml.rels", slide_master_relationships());
    write_part(ppt / "slideLayouts" / "slideLayout1.xml", blank_layout());
    write_part(ppt / "slideLayouts" / "_rels" / "slideLayout1.xml.rels", blank_layout_relationships());
    write_part(ppt / "theme" / "theme1.xml", theme());

    std::error_code ec;
    fs::create_directories(ppt / "media", ec);
    if (ec) {
        throw ArtifactError("cannot create " + (ppt / "media").string() + ": " + ec.message());
    }

    for (std::size_t i = 0; i < count; ++i) {
        std::size_t number = i + 1;
        fs::path media = ppt / "media" / ("image" + std::to_string(number) + ".png");
        fs::copy_file(images[i], media, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw ArtifactError("cannot copy " + images[i].string() + ": " + ec.message());
        }

        std::string slide_name = "slide" + std::to_string(number) + ".xml";
        write_part(ppt / "slides" / slide_name, picture_slide(images[i].filename().string()));
        write_part(ppt / "slides" / "_rels" / (slide_name + ".rels"),
                   picture_slide_relationships(number));
    }
}

fs::path PptxDeckWriter::write(const std::vector<fs::path>& images, const fs::path& output,
                               const std::string& title) {
    if (images.empty()) {
        throw ArtifactError("no slide images to assemble into " + output.string());
    }

    ScopedDirectory staging(make_staging_dir());
    stage(images, staging.path(), title);

    fs::path target = fs::absolute(output);
    fs::path partial = target;
    partial += ".partial";

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw ArtifactError("cannot create " + target.parent_path().string() + ": " + ec.message());
    }
    // zip appends to an existing archive
    fs::remove(partial, ec);

    std::string command = "cd " + shell_quote(staging.path().string()) + " && " +
                          shell_quote(zip_executable_) + " -q -X -r " +
                          shell_quote(partial.string()) + " .";
    CommandResult result = run_command(command);
    if (result.exit_code != 0) {
        fs::remove(partial, ec);
        throw ArtifactError("zip exited with status " + std::to_string(result.exit_code) +
                            " while writing " + target.string() + ": " + result.output);
    }

    fs::rename(partial, target, ec);
    if (ec) {
        fs::remove(partial, ec);
        throw ArtifactError("cannot move deck into place at " + target.string());
    }
    return target;
}

fs::path resolve_deck_path(const std::string& output, const fs::path& image_dir,
                           const std::string& video_id, const std::string& extension) {
    std::string file_name = video_id + extension;
    if (output.empty()) {
        return image_dir / file_name;
    }

    fs::path path(output);
    std::error_code ec;
    if (fs::is_directory(path, ec) || output.back() == '/') {
        return path / file_name;
    }
    return path;
}

} // namespace vid2slides
