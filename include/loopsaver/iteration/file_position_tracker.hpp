// EN: FilePositionTracker - line iteration over a stream that resumes from a checkpointed byte offset
// FR: FilePositionTracker - itération par lignes sur un flux qui reprend depuis un offset d'octet sauvegardé

#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "loopsaver/iteration/iteration_options.hpp"
#include "loopsaver/iteration/pull_iterator.hpp"
#include "loopsaver/state/checkpoint_scope.hpp"

namespace LSV {

// EN: Scan backward from pos in windows of window_step, 2 * window_step, ... bytes and seek the stream
//     to the start of the line holding byte pos - 1. Returns that offset, 0 when the scan reaches the start.
//     The result r satisfies r <= pos and (r == 0 or byte r - 1 is '\n').
// FR: Parcourt à rebours depuis pos par fenêtres de window_step, 2 * window_step, ... octets et positionne
//     le flux au début de la ligne contenant l'octet pos - 1. Retourne cet offset, 0 si le début est atteint.
//     Le résultat r vérifie r <= pos et (r == 0 ou l'octet r - 1 vaut '\n').
std::streamoff rewindToLineStart(std::istream& stream, std::streamoff pos, size_t window_step = 100);

class FilePositionTracker : public Checkpointed {
public:
    using iterator = PullIterator<FilePositionTracker, std::string>;

    // EN: Takes ownership of an open stream. The checkpoint holds {"pos": offset} plus auxiliary keys.
    // FR: Prend possession d'un flux ouvert. Le checkpoint contient {"pos": offset} plus des clés auxiliaires.
    FilePositionTracker(std::unique_ptr<std::istream> stream, std::filesystem::path checkpoint_path,
                        IterationOptions options = IterationOptions());
    ~FilePositionTracker() override;

    // EN: Open data_path in binary mode. Throws IOFailure.
    // FR: Ouvre data_path en mode binaire. Lance IOFailure.
    static std::unique_ptr<FilePositionTracker> openFile(const std::filesystem::path& data_path,
                                                         std::filesystem::path checkpoint_path,
                                                         IterationOptions options = IterationOptions());

    // EN: Next line without its terminating '\n'. std::nullopt at end of stream (checkpoint erased).
    // FR: Ligne suivante sans son '\n' final. std::nullopt en fin de flux (checkpoint effacé).
    std::optional<std::string> nextLine();
    std::optional<std::string> next() { return nextLine(); }

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    template<typename Fn>
    CompletionStatus forEach(Fn&& fn) {
        return driveLoop(*this, std::forward<Fn>(fn));
    }

    // EN: Byte offset of the next unread line
    // FR: Offset d'octet de la prochaine ligne non lue
    std::streamoff position() const { return offset_; }

    // EN: Offset reading started from after resume and realignment
    // FR: Offset de départ de la lecture après reprise et réalignement
    std::streamoff startOffset() const { return start_offset_; }

    bool realigned() const { return realigned_; }
    bool streamOpen() const { return stream_ != nullptr; }

    const IterationOptions& options() const { return options_; }

protected:
    void onClose(CompletionStatus status) override;
    bool isReservedKey(const std::string& key) const override;

private:
    std::streamoff resolveStartOffset(std::streamoff saved);
    [[noreturn]] void throwReadFailure(const std::string& operation) const;

    std::unique_ptr<std::istream> stream_;
    IterationOptions options_;
    std::streamoff offset_ = 0;
    std::streamoff start_offset_ = 0;
    std::optional<std::streamoff> last_line_start_;
    bool realigned_ = false;
};

} // namespace LSV
