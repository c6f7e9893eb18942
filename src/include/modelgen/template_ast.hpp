#pragma once

#include <modelgen/value.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace modelgen::tmpl {

  struct pipeline;

  enum class operand_kind {
    dot,       // .
    field,     // .Name (fields holds the chain)
    variable,  // $name (fields holds an optional chain)
    literal,   // string, number, bool, nil
    function,  // identifier naming a template function
    pipeline,  // ( pipeline ) with an optional chain
  };

  struct operand {
    operand_kind kind = operand_kind::dot;
    std::string name;
    std::vector<std::string> fields;
    value literal;
    std::shared_ptr<const pipeline> inner;
  };

  struct command {
    std::vector<operand> operands;
  };

  struct pipeline {
    std::size_t line = 0;
    // Variables declared ($x := ...) or assigned ($x = ...) by the pipeline.
    std::vector<std::string> variables;
    bool is_assignment = false;
    std::vector<command> commands;
  };

  class node;

  using node_list = std::vector<node>;

  struct text_node {
    std::string text;
  };

  struct action_node {
    pipeline pipe;
  };

  struct if_node {
    pipeline pipe;
    node_list list;
    node_list else_list;
  };

  struct range_node {
    pipeline pipe;
    node_list list;
    node_list else_list;
  };

  struct with_node {
    pipeline pipe;
    node_list list;
    node_list else_list;
  };

  struct template_call_node {
    std::string name;
    std::optional<pipeline> pipe;
  };

  struct break_node {};

  struct continue_node {};

  class node {
  public:
    using variant_type =
        std::variant<text_node, action_node, if_node, range_node, with_node,
                     template_call_node, break_node, continue_node>;

    template <typename T>
    node(T v, std::size_t line) : data_(std::move(v)), line_(line) {}

    const variant_type&
    data() const {
      return data_;
    }

    variant_type&
    data() {
      return data_;
    }

    template <typename T>
    bool
    holds() const {
      return std::holds_alternative<T>(data_);
    }

    template <typename T>
    const T&
    get() const {
      return std::get<T>(data_);
    }

    std::size_t
    line() const {
      return line_;
    }

  private:
    variant_type data_;
    std::size_t line_;
  };

  // Result of parsing one template text: top-level content plus every
  // {{define}} block, in source order.
  struct parse_tree {
    node_list body;
    std::vector<std::pair<std::string, node_list>> definitions;
  };

  // True when a list renders nothing regardless of data: empty or
  // whitespace-only text.
  bool
  is_empty_list(const node_list& list);

} // namespace modelgen::tmpl
