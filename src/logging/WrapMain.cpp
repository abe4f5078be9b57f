#include <absl/log/log.h>

#include <AbslLogInit.hpp>

extern int app_main(int argc, char** argv);

int main(int argc, char** argv) {
    ChunkXfer_AbslLogInit();
    DLOG(INFO) << "Launching " << argv[0] << " with " << argc << " args";
    const int ret = app_main(argc, argv);
    ChunkXfer_AbslLogDeInit();
    return ret;
}
