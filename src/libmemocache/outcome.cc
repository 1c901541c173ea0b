#include "memo/cache/outcome.hh"

namespace memo {

std::string describeCurrentException()
{
    try {
        throw;
    } catch (BaseError & e) {
        return e.message();
    } catch (std::exception & e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace memo
