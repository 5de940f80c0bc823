// Implementation file for ordered_tree.hpp
// This file contains all method implementations for the ordered_tree class.

namespace kressler::ordered_tree {

// Constructor
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
ordered_tree<T, Compare, Allocator>::ordered_tree(const Allocator& alloc)
    : comp_(), node_alloc_(alloc), root_(nullptr), size_(0) {}

// Destructor
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
ordered_tree<T, Compare, Allocator>::~ordered_tree() {
  deallocate_subtree(root_);
}

// Copy constructor
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
ordered_tree<T, Compare, Allocator>::ordered_tree(const ordered_tree& other)
    : comp_(other.comp_),
      node_alloc_(node_traits::select_on_container_copy_construction(
          other.node_alloc_)),
      root_(nullptr),
      size_(0) {
  copy_nodes(other.root_);
}

// Copy assignment operator
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
ordered_tree<T, Compare, Allocator>&
ordered_tree<T, Compare, Allocator>::operator=(const ordered_tree& other) {
  if (this != &other) {
    // Existing nodes go back to the allocator that created them
    clear();

    if constexpr (node_traits::propagate_on_container_copy_assignment::value) {
      node_alloc_ = other.node_alloc_;
    }
    comp_ = other.comp_;
    copy_nodes(other.root_);
  }
  return *this;
}

// Move constructor
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
ordered_tree<T, Compare, Allocator>::ordered_tree(ordered_tree&& other) noexcept
    : comp_(std::move(other.comp_)),
      node_alloc_(std::move(other.node_alloc_)),
      root_(other.root_),
      size_(other.size_) {
  // Leave other in a valid empty state
  other.root_ = nullptr;
  other.size_ = 0;
}

// Move assignment operator
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
ordered_tree<T, Compare, Allocator>&
ordered_tree<T, Compare, Allocator>::operator=(ordered_tree&& other) noexcept {
  if (this != &other) {
    // Deallocate existing nodes
    deallocate_subtree(root_);

    // Move other's resources to this
    comp_ = std::move(other.comp_);
    node_alloc_ = std::move(other.node_alloc_);
    root_ = other.root_;
    size_ = other.size_;

    // Leave other in a valid empty state
    other.root_ = nullptr;
    other.size_ = 0;
  }
  return *this;
}

// Initializer list constructor
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
ordered_tree<T, Compare, Allocator>::ordered_tree(std::initializer_list<T> init,
                                                  const Allocator& alloc)
    : ordered_tree(alloc) {
  for (const auto& elem : init) {
    insert(elem);
  }
}

// Range constructor
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
template <std::input_iterator InputIt>
ordered_tree<T, Compare, Allocator>::ordered_tree(InputIt first, InputIt last,
                                                  const Allocator& alloc)
    : ordered_tree(alloc) {
  for (auto it = first; it != last; ++it) {
    if constexpr (detail::is_optional_v<decltype(*it)>) {
      const auto& elem = *it;
      if (elem.has_value()) {
        insert(*elem);
      }
    } else {
      insert(*it);
    }
  }
}

// Array constructor
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
ordered_tree<T, Compare, Allocator>::ordered_tree(const T* elements,
                                                  size_type count,
                                                  const Allocator& alloc)
    : ordered_tree(alloc) {
  if (elements == nullptr) {
    throw std::invalid_argument("ordered_tree: source array is null");
  }
  for (size_type i = 0; i < count; ++i) {
    insert(elements[i]);
  }
}

// height
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
typename ordered_tree<T, Compare, Allocator>::size_type
ordered_tree<T, Compare, Allocator>::height() const {
  // Count levels of a breadth-first sweep
  size_type levels = 0;
  std::vector<const tree_node*> current_level;
  std::vector<const tree_node*> next_level;
  if (root_ != nullptr) {
    current_level.push_back(root_);
  }
  while (!current_level.empty()) {
    ++levels;
    next_level.clear();
    for (const tree_node* node : current_level) {
      if (node->left != nullptr) next_level.push_back(node->left);
      if (node->right != nullptr) next_level.push_back(node->right);
    }
    current_level.swap(next_level);
  }
  return levels;
}

// contains
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
bool ordered_tree<T, Compare, Allocator>::contains(const T& element) const {
  const tree_node* curr = root_;
  while (curr != nullptr) {
    if (comp_(element, curr->value)) {
      curr = curr->left;
    } else if (comp_(curr->value, element)) {
      curr = curr->right;
    } else {
      return true;
    }
  }
  return false;
}

// min
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
std::optional<T> ordered_tree<T, Compare, Allocator>::min() const {
  if (root_ == nullptr) {
    return std::nullopt;
  }
  const tree_node* curr = root_;
  while (curr->left != nullptr) {
    curr = curr->left;
  }
  return curr->value;
}

// max
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
std::optional<T> ordered_tree<T, Compare, Allocator>::max() const {
  if (root_ == nullptr) {
    return std::nullopt;
  }
  const tree_node* curr = root_;
  while (curr->right != nullptr) {
    curr = curr->right;
  }
  return curr->value;
}

// insert (copy)
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
bool ordered_tree<T, Compare, Allocator>::insert(const T& element) {
  return insert_impl(element);
}

// insert (move)
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
bool ordered_tree<T, Compare, Allocator>::insert(T&& element) {
  return insert_impl(std::move(element));
}

// emplace
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
template <typename... Args>
bool ordered_tree<T, Compare, Allocator>::emplace(Args&&... args) {
  // The element must exist before it can be compared
  T element(std::forward<Args>(args)...);
  return insert_impl(std::move(element));
}

// insert_impl
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
template <typename U>
bool ordered_tree<T, Compare, Allocator>::insert_impl(U&& element) {
  // link is the parent's child slot (or root_) that the search descends into
  tree_node** link = &root_;
  while (*link != nullptr) {
    if (comp_(element, (*link)->value)) {
      link = &(*link)->left;
    } else if (comp_((*link)->value, element)) {
      link = &(*link)->right;
    } else {
      return false;  // Duplicate element
    }
  }

  *link = allocate_node(std::forward<U>(element));
  ++size_;
  return true;
}

// erase
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
bool ordered_tree<T, Compare, Allocator>::erase(const T& element) {
  tree_node** link = &root_;
  while (*link != nullptr) {
    if (comp_(element, (*link)->value)) {
      link = &(*link)->left;
    } else if (comp_((*link)->value, element)) {
      link = &(*link)->right;
    } else {
      break;
    }
  }

  tree_node* target = *link;
  if (target == nullptr) {
    return false;
  }

  if (target->left == nullptr) {
    // Zero children or right child only: splice in the right subtree
    *link = target->right;
    deallocate_node(target);
  } else {
    // Promote the in-order predecessor into target, then unlink it. When the
    // predecessor is target's immediate left child, pred_link is
    // &target->left; otherwise it is the right slot of the predecessor's
    // parent.
    tree_node** pred_link = &target->left;
    while ((*pred_link)->right != nullptr) {
      pred_link = &(*pred_link)->right;
    }
    tree_node* predecessor = *pred_link;
    target->value = std::move(predecessor->value);
    *pred_link = predecessor->left;
    deallocate_node(predecessor);
  }

  --size_;
  return true;
}

// clear
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
void ordered_tree<T, Compare, Allocator>::clear() {
  deallocate_subtree(root_);
  root_ = nullptr;
  size_ = 0;
}

// balance
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
void ordered_tree<T, Compare, Allocator>::balance() {
  if (size_ <= 2) {
    return;
  }

  std::vector<T> elements;
  elements.reserve(size_);
  visit_nodes(root_, Traversal::InOrder, [&elements](tree_node* node) {
    elements.push_back(std::move(node->value));
  });

  deallocate_subtree(root_);
  root_ = nullptr;
  try {
    root_ = build(elements, 0, static_cast<difference_type>(size_) - 1);
  } catch (...) {
    size_ = 0;
    throw;
  }
}

// build
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
typename ordered_tree<T, Compare, Allocator>::tree_node*
ordered_tree<T, Compare, Allocator>::build(std::vector<T>& elements,
                                           difference_type low,
                                           difference_type high) {
  if (low > high) {
    return nullptr;
  }

  // Lower median on even-length ranges
  difference_type mid = low + (high - low) / 2;
  tree_node* curr = allocate_node(std::move(elements[mid]));
  try {
    curr->left = build(elements, low, mid - 1);
    curr->right = build(elements, mid + 1, high);
  } catch (...) {
    deallocate_subtree(curr);
    throw;
  }
  return curr;
}

// for_each
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
template <typename Visitor>
void ordered_tree<T, Compare, Allocator>::for_each(Traversal order,
                                                   Visitor&& visitor) const {
  const tree_node* root = root_;
  visit_nodes(root, order,
              [&visitor](const tree_node* node) { visitor(node->value); });
}

// to_vector
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
std::vector<T> ordered_tree<T, Compare, Allocator>::to_vector(
    Traversal order) const {
  std::vector<T> result;
  result.reserve(size_);
  for_each(order, [&result](const T& element) { result.push_back(element); });
  return result;
}

// to_string
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
std::string ordered_tree<T, Compare, Allocator>::to_string(
    Traversal order) const {
  std::ostringstream out;
  out << '[';
  bool first = true;
  for_each(order, [&out, &first](const T& element) {
    if (!first) {
      out << ", ";
    }
    out << element;
    first = false;
  });
  out << ']';
  return out.str();
}

// swap
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
void ordered_tree<T, Compare, Allocator>::swap(ordered_tree& other) noexcept {
  using std::swap;
  swap(comp_, other.comp_);
  if constexpr (node_traits::propagate_on_container_swap::value) {
    swap(node_alloc_, other.node_alloc_);
  }
  swap(root_, other.root_);
  swap(size_, other.size_);
}

// visit_nodes
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
template <typename NodePtr, typename Visitor>
void ordered_tree<T, Compare, Allocator>::visit_nodes(NodePtr root,
                                                      Traversal order,
                                                      Visitor&& visitor) {
  if (root == nullptr) {
    return;
  }

  std::vector<NodePtr> stack;
  switch (order) {
    case Traversal::InOrder: {
      NodePtr curr = root;
      while (curr != nullptr || !stack.empty()) {
        // Descend the left spine, then visit and step into the right subtree
        while (curr != nullptr) {
          stack.push_back(curr);
          curr = curr->left;
        }
        curr = stack.back();
        stack.pop_back();
        NodePtr right = curr->right;
        visitor(curr);
        curr = right;
      }
      break;
    }

    case Traversal::PreOrder: {
      stack.push_back(root);
      while (!stack.empty()) {
        NodePtr curr = stack.back();
        stack.pop_back();
        visitor(curr);
        // Right is pushed first so that left is visited first
        if (curr->right != nullptr) stack.push_back(curr->right);
        if (curr->left != nullptr) stack.push_back(curr->left);
      }
      break;
    }

    case Traversal::PostOrder: {
      NodePtr curr = root;
      NodePtr last_visited = nullptr;
      while (curr != nullptr || !stack.empty()) {
        if (curr != nullptr) {
          stack.push_back(curr);
          curr = curr->left;
          continue;
        }
        NodePtr top = stack.back();
        if (top->right != nullptr && top->right != last_visited) {
          // Right subtree not done yet
          curr = top->right;
        } else {
          visitor(top);
          last_visited = top;
          stack.pop_back();
        }
      }
      break;
    }

    case Traversal::BreadthFirst: {
      // Each level is derived from the children of the previous one
      std::vector<NodePtr> next_level;
      stack.push_back(root);
      while (!stack.empty()) {
        next_level.clear();
        for (NodePtr curr : stack) {
          visitor(curr);
          if (curr->left != nullptr) next_level.push_back(curr->left);
          if (curr->right != nullptr) next_level.push_back(curr->right);
        }
        stack.swap(next_level);
      }
      break;
    }
  }
}

// copy_nodes
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
void ordered_tree<T, Compare, Allocator>::copy_nodes(const tree_node* source) {
  assert(root_ == nullptr && size_ == 0 && "copy_nodes requires an empty tree");

  // Each entry is a source node and the link its clone must be stored in
  std::vector<std::pair<const tree_node*, tree_node**>> pending;
  if (source != nullptr) {
    pending.emplace_back(source, &root_);
  }

  try {
    while (!pending.empty()) {
      auto [src, link] = pending.back();
      pending.pop_back();

      tree_node* clone = allocate_node(src->value);
      *link = clone;
      ++size_;

      if (src->right != nullptr) {
        pending.emplace_back(src->right, &clone->right);
      }
      if (src->left != nullptr) {
        pending.emplace_back(src->left, &clone->left);
      }
    }
  } catch (...) {
    // Every link that has not been filled is still null, so the partial
    // clone is a valid tree
    clear();
    throw;
  }
}

// allocate_node
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
template <typename... Args>
typename ordered_tree<T, Compare, Allocator>::tree_node*
ordered_tree<T, Compare, Allocator>::allocate_node(Args&&... args) {
  tree_node* node = node_traits::allocate(node_alloc_, 1);
  try {
    node_traits::construct(node_alloc_, node, std::in_place,
                           std::forward<Args>(args)...);
  } catch (...) {
    node_traits::deallocate(node_alloc_, node, 1);
    throw;
  }
  return node;
}

// deallocate_node
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
void ordered_tree<T, Compare, Allocator>::deallocate_node(
    tree_node* node) noexcept {
  node_traits::destroy(node_alloc_, node);
  node_traits::deallocate(node_alloc_, node, 1);
}

// deallocate_subtree
template <typename T, typename Compare, typename Allocator>
  requires ComparatorCompatible<T, Compare>
void ordered_tree<T, Compare, Allocator>::deallocate_subtree(
    tree_node* node) noexcept {
  while (node != nullptr) {
    if (node->left != nullptr) {
      // Rotate right so the left child becomes the new top
      tree_node* left = node->left;
      node->left = left->right;
      left->right = node;
      node = left;
    } else {
      tree_node* right = node->right;
      deallocate_node(node);
      node = right;
    }
  }
}

}  // namespace kressler::ordered_tree
