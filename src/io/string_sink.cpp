#include <transcode/sink.h>

namespace transcode {

void StringSink::write(std::string_view bytes) {
    data_.append(bytes);
}

void StringSink::commit() {
    committed_ = true;
}

} // namespace transcode
