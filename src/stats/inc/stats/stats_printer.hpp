#ifndef POWMINER_STATS_PRINTER_HPP
#define POWMINER_STATS_PRINTER_HPP

namespace powminer {
namespace stats
{
class Printer {
public:

    virtual ~Printer() = default;

    virtual void print() = 0;
};

}
}
#endif
