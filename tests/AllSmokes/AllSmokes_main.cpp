// ============================================================================
// Keel - tests/AllSmokes/AllSmokes_main.cpp
// ----------------------------------------------------------------------------
// Purpose : Run every Keel smoke helper in one process, or only the ones named
//           on the command line (e.g. `AllSmokes Arena Utf8`).
// Contract: Exit code 0 when every selected smoke returns 0, 1 otherwise.
//           An unknown name counts as a failure.
// Notes   : Smokes run in table order; later ones observe the policy flags
//           earlier ones left behind (all of them select non-fatal).
// ============================================================================

#include <cstdio>
#include <cstring>

int RunArenaSmoke();
int RunRawBufferSmoke();
int RunUtf8Smoke();
int RunCharStreamSmoke();

namespace
{
    struct SmokeEntry
    {
        const char* name;
        int (*run)();
    };

    constexpr SmokeEntry kSmokes[] = {
        {"Arena", &RunArenaSmoke},
        {"RawBuffer", &RunRawBufferSmoke},
        {"Utf8", &RunUtf8Smoke},
        {"CharStream", &RunCharStreamSmoke},
    };

    bool Report(const SmokeEntry& entry)
    {
        const int code = entry.run();
        std::printf("%s: %s (code=%d)\n", entry.name, code == 0 ? "OK" : "FAIL", code);
        return code == 0;
    }

    const SmokeEntry* Find(const char* name)
    {
        for (const SmokeEntry& entry : kSmokes)
            if (std::strcmp(entry.name, name) == 0)
                return &entry;
        return nullptr;
    }
}

int main(int argc, char** argv)
{
    int failures = 0;

    if (argc <= 1)
    {
        for (const SmokeEntry& entry : kSmokes)
            failures += Report(entry) ? 0 : 1;
    }
    else
    {
        for (int i = 1; i < argc; ++i)
        {
            const SmokeEntry* entry = Find(argv[i]);
            if (!entry)
            {
                std::printf("%s: unknown smoke\n", argv[i]);
                ++failures;
                continue;
            }
            failures += Report(*entry) ? 0 : 1;
        }
    }

    std::printf("%d failure(s)\n", failures);
    return failures == 0 ? 0 : 1;
}
