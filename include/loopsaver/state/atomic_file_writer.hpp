// EN: Atomic file replacement - write to a temporary sibling, then rename over the target
// FR: Remplacement atomique de fichier - écrit dans un fichier temporaire voisin, puis renomme sur la cible

#pragma once

#include <filesystem>
#include <fstream>
#include <string_view>

namespace LSV {

// EN: Buffers a whole checkpoint write in `<target>.tmp`. Nothing touches the target until commit();
//     a writer destroyed without commit() removes its temporary file and leaves the target untouched.
// FR: Met en tampon l'écriture complète d'un checkpoint dans `<cible>.tmp`. Rien ne touche la cible avant commit() ;
//     un writer détruit sans commit() supprime son fichier temporaire et laisse la cible intacte.
class AtomicFileWriter {
public:
    explicit AtomicFileWriter(std::filesystem::path target, bool durable = true);
    ~AtomicFileWriter();

    AtomicFileWriter(const AtomicFileWriter&) = delete;
    AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;

    std::ostream& stream() { return out_; }

    void write(std::string_view data);
    void writeLine(std::string_view line);

    // EN: Flush, sync and rename over the target. Throws IOFailure.
    // FR: Vide, synchronise et renomme sur la cible. Lance IOFailure.
    void commit();

    // EN: Drop the temporary file. Safe to call more than once.
    // FR: Abandonne le fichier temporaire. Peut être appelé plusieurs fois.
    void discard() noexcept;

    const std::filesystem::path& targetPath() const { return target_; }
    const std::filesystem::path& tempPath() const { return temp_; }
    bool committed() const { return committed_; }

    static std::filesystem::path tempPathFor(const std::filesystem::path& target);

private:
    void checkStream(const char* operation);

    std::filesystem::path target_;
    std::filesystem::path temp_;
    std::ofstream out_;
    bool durable_;
    bool committed_ = false;
    bool discarded_ = false;
};

} // namespace LSV
