#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>

// tree construction from zero leaves
class EmptyInputError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
};

// proof requested for a leaf that is not in the tree
class LeafNotFoundError : public std::out_of_range {
    public:
        using std::out_of_range::out_of_range;
};

// amount does not fit in a uint256
class AmountOverflowError : public std::overflow_error {
    public:
        using std::overflow_error::overflow_error;
};

// malformed hex, address or decimal text
class InvalidEncodingError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
};

#endif
