// Wire parser layout:
// - 00: error construction + field access helpers
// - 01: id index pass (duplicate detection)
// - 02: node builders (ref resolution, cycle detection, aliases)
// - 03: entry points (envelope, implicit program)

#include "wire_parser_parts/00_wire_parser_fields.cpp"
#include "wire_parser_parts/01_wire_parser_index.cpp"
#include "wire_parser_parts/02_wire_parser_nodes.cpp"
#include "wire_parser_parts/03_wire_parser_entry.cpp"
