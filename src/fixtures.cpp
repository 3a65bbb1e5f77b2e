#include "quadrant/fixtures.h"

#include "quadrant/klog.h"
#include "quadrant/kstring.h"

namespace quadrant {

static const Fixture FIXTURES[NUM_FIXTURES] = {
    { "hello",
      "print(\"Hello, world!\")" },
    { "nums",
      "print(1)\n"
      "print(257)" },
    { "average",
      "sum := 0\n"
      "count := 0\n"
      "averaging := true\n"
      "while averaging {\n"
      "    num := input(\"Enter a number:\")\n"
      "    if (num == \"quit\") {\n"
      "        averaging := false\n"
      "    } else {\n"
      "        sum := (sum + num)\n"
      "        count := (count + 1)\n"
      "    }\n"
      "}\n"
      "print((sum / count))" },
    { "pi",
      "sum := 0\n"
      "i := 0\n"
      "neg := false\n"
      "terms := input(\"Num terms:\")\n"
      "while (i < terms) {\n"
      "    term := (1.0 / ((2.0 * i) + 1.0))\n"
      "    if neg {\n"
      "        term := -term\n"
      "    }\n"
      "    sum := (sum + term)\n"
      "    neg := not neg\n"
      "    i := (i + 1)\n"
      "}\n"
      "print((4 * sum))" },
};

const Fixture& fixture(int index) {
    QUADRANT_ASSERT(index >= 0 && index < NUM_FIXTURES, "fixture index out of range");
    return FIXTURES[index];
}

int seed_fixtures(FileSystem& fs) {
    for (int i = 0; i < NUM_FIXTURES; i++) {
        const Fixture& f = FIXTURES[i];
        int fd = fs.open_create(f.name);
        if (fd < 0) return fd;
        int written = fs.write(fd, f.source, (int)k_strlen(f.source));
        int closed = fs.close(fd);
        if (written < 0) return written;
        if (closed < 0) return closed;
    }
    return FS_OK;
}

}
