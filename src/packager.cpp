// ═══════════════════════════════════════════════════════════════════
//  packager.cpp — Function, layer and schema artifact assembly
// ═══════════════════════════════════════════════════════════════════

#include "forgepp/packager.h"
#include "forgepp/console.h"
#include "forgepp/crypto.h"
#include "forgepp/errors.h"
#include "forgepp/fs.h"
#include "forgepp/path.h"

namespace forgepp {

namespace {

std::string relativeArchivePath(const std::filesystem::path& file, const std::filesystem::path& root) {
    if (!path::isWithin(file, root)) {
        throw PackagingError(file.string() + " is outside " + root.string());
    }
    return file.lexically_relative(root).generic_string();
}

std::string formatBytes(std::uint64_t bytes) {
    if (bytes < 1024) return std::to_string(bytes) + " B";
    if (bytes < 1024 * 1024) return std::to_string(bytes / 1024) + " KiB";
    return std::to_string(bytes / (1024 * 1024)) + " MiB";
}

void requireListing(const std::string& name, const std::string& listingError) {
    if (!listingError.empty()) {
        throw PackagingError("Cannot list sources for " + name + ": " + listingError);
    }
}

} // namespace

std::map<std::string, std::filesystem::path> ArtifactPackager::layout(const FunctionUnit& unit) const {
    requireListing(unit.name, unit.listingError);
    std::map<std::string, std::filesystem::path> files;
    files.emplace(unit.handler.filename().generic_string(), unit.handler);

    for (auto& module : unit.sharedModules) {
        auto archivePath = relativeArchivePath(module, unit.moduleRoot);
        auto [it, inserted] = files.emplace(archivePath, module);
        if (!inserted && it->second != module) {
            throw PackagingError("Archive path collision in " + unit.name + ": " + archivePath +
                                 " (" + it->second.string() + " and " + module.string() + ")");
        }
    }
    return files;
}

std::map<std::string, std::filesystem::path> ArtifactPackager::layout(const LayerUnit& unit) const {
    requireListing(unit.name, unit.listingError);
    std::map<std::string, std::filesystem::path> files;
    auto prefix = config_.layerRootDir + "/" + unit.name + "/";
    for (auto& file : unit.files) {
        files.emplace(prefix + relativeArchivePath(file, unit.sourceDir), file);
    }
    return files;
}

BuildResult ArtifactPackager::package(const FunctionUnit& unit,
                                      const std::filesystem::path& destinationDir) const {
    return writeArchive(unit.name, UnitKind::Function, layout(unit), destinationDir / (unit.name + ".zip"));
}

BuildResult ArtifactPackager::package(const LayerUnit& unit,
                                      const std::filesystem::path& destinationDir) const {
    return writeArchive(unit.name, UnitKind::Layer, layout(unit), destinationDir / (unit.name + ".zip"));
}

BuildResult ArtifactPackager::writeArchive(const std::string& name, UnitKind kind,
                                           const std::map<std::string, std::filesystem::path>& files,
                                           const std::filesystem::path& destination) const {
    try {
        zip::ZipWriter writer;
        for (auto& [archivePath, source] : files) {
            if (!fs::isFileSync(source)) {
                throw PackagingError("Source file missing for " + name + ": " + source.string());
            }
            writer.add(archivePath, fs::readFileSync(source));
            console::debug("  +", archivePath);
        }

        auto bytes = writer.finish();
        if (bytes.size() > config_.maxArchiveBytes) {
            throw PackagingError("Archive for " + name + " is " + formatBytes(bytes.size()) +
                                 ", over the " + formatBytes(config_.maxArchiveBytes) + " limit");
        }

        fs::AtomicFile out(destination);
        out.write(bytes);
        out.commit();

        BuildResult result;
        result.name = name;
        result.kind = kind;
        result.status = UnitStatus::Succeeded;
        result.filesProcessed = writer.entryCount();
        result.archiveSize = bytes.size();
        result.artifact = destination.string();
        result.codeSha256 = crypto::codeSha256(bytes);
        return result;
    } catch (const BuildError&) {
        throw;
    } catch (const std::exception& e) {
        throw PackagingError("Failed to package " + name + ": " + e.what());
    }
}

BuildResult ArtifactPackager::packageSchema(const SchemaUnit& unit, const MergedDocument& document,
                                            const std::filesystem::path& destinationDir) const {
    auto destination = destinationDir / (unit.name + config_.schemaExtension);
    try {
        fs::writeFileAtomicSync(destination, document.text);
    } catch (const std::exception& e) {
        throw PackagingError("Failed to write schema " + unit.name + ": " + e.what());
    }

    BuildResult result;
    result.name = unit.name;
    result.kind = UnitKind::Schema;
    result.status = UnitStatus::Succeeded;
    result.filesProcessed = document.fragmentCount();
    result.archiveSize = document.text.size();
    result.artifact = destination.string();
    result.codeSha256 = crypto::codeSha256(document.text);
    return result;
}

} // namespace forgepp
